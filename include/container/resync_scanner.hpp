#ifndef XDF_CONTAINER_RESYNC_SCANNER_HPP
#define XDF_CONTAINER_RESYNC_SCANNER_HPP

#include <array>
#include <cstdint>
#include <istream>

namespace xdf {
namespace container {

// Finds the next Boundary chunk after a corrupted region
class ResyncScanner {
public:
  // UUID carried by every Boundary chunk
  static constexpr std::array<uint8_t, 16> BOUNDARY_SIGNATURE = {
    0x43, 0xA5, 0x46, 0xDC, 0xCB, 0xF5, 0x41, 0x0F,
    0xB3, 0x0E, 0xD5, 0x46, 0x73, 0x83, 0xCB, 0xE4
  };
  static constexpr std::size_t DEFAULT_WINDOW_SIZE = 1 << 20;

  // ---- CONSTRUCTOR ----
  explicit ResyncScanner(std::size_t window_size = DEFAULT_WINDOW_SIZE);


  // ---- SCANNING ----
  // Scans forward from the current position. On a match the stream is left
  // just past the signature and true is returned; otherwise the stream is
  // left at end of input (state cleared) and false is returned.
  bool scan_forward(std::istream& input) const;

private:
  std::size_t window_size_;
};

} // namespace container
} // namespace xdf

#endif // XDF_CONTAINER_RESYNC_SCANNER_HPP
