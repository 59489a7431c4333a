#include "store/file_record.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include "codec/digest.hpp"
#include "store/path_utils.hpp"

namespace chunkvault {
namespace store {

std::string generate_file_id() {
  return codec::random_hex(16);
}

std::string make_stored_name(const std::string& original_name) {
  return codec::random_hex(8) + "_" + sanitize_filename(original_name);
}

std::string current_timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
      now.time_since_epoch()).count() % 1000000;

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
     << std::setw(6) << std::setfill('0') << micros << 'Z';
  return ss.str();
}

} // namespace store
} // namespace chunkvault
