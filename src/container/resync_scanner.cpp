#include "container/resync_scanner.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <vector>

namespace xdf {
namespace container {

ResyncScanner::ResyncScanner(std::size_t window_size)
  : window_size_(std::max(window_size, BOUNDARY_SIGNATURE.size())) {}

bool ResyncScanner::scan_forward(std::istream& input) const {
  input.clear();
  std::vector<char> window(window_size_);
  const auto* sig_begin = reinterpret_cast<const char*>(BOUNDARY_SIGNATURE.data());
  const auto* sig_end = sig_begin + BOUNDARY_SIGNATURE.size();

  while (true) {
    const std::streamoff window_pos = input.tellg();
    if (window_pos < 0) {
      BOOST_LOG_TRIVIAL(error) << "ResyncScanner: Cannot determine stream position";
      return false;
    }

    input.read(window.data(), static_cast<std::streamsize>(window.size()));
    const std::size_t got = static_cast<std::size_t>(input.gcount());

    auto window_end = window.begin() + static_cast<std::ptrdiff_t>(got);
    auto match = std::search(window.begin(), window_end, sig_begin, sig_end);
    if (match != window_end) {
      const std::streamoff found_at = window_pos + (match - window.begin());
      input.clear();
      input.seekg(found_at + static_cast<std::streamoff>(BOUNDARY_SIGNATURE.size()));
      BOOST_LOG_TRIVIAL(debug) << "ResyncScanner: Found boundary chunk signature at offset " << found_at;
      return true;
    }

    if (got < window.size()) {
      input.clear();
      input.seekg(0, std::ios::end);
      BOOST_LOG_TRIVIAL(debug) << "ResyncScanner: Reached end of input with no boundary chunk";
      return false;
    }

    // Step back so a signature split across two windows is still seen
    input.seekg(window_pos + static_cast<std::streamoff>(got - (BOUNDARY_SIGNATURE.size() - 1)));
  }
}

} // namespace container
} // namespace xdf
