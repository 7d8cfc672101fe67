#include "aigw/utils/uuid.hpp"

#include <array>
#include <random>

namespace aigw::utils {
namespace {

std::mt19937_64& generator() {
  static thread_local std::mt19937_64 engine = [] {
    std::random_device rd;
    std::seed_seq seed{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    return std::mt19937_64(seed);
  }();
  return engine;
}

}  // namespace

std::string uuid4() {
  std::array<unsigned char, 16> data{};
  std::uniform_int_distribution<int> byte(0, 255);
  for (auto& value : data) {
    value = static_cast<unsigned char>(byte(generator()));
  }

  data[6] = (data[6] & 0x0F) | 0x40;  // version 4
  data[8] = (data[8] & 0x3F) | 0x80;  // variant 1

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < data.size(); ++i) {
    out.push_back(kHex[data[i] >> 4]);
    out.push_back(kHex[data[i] & 0x0F]);
    if (i == 3 || i == 5 || i == 7 || i == 9) {
      out.push_back('-');
    }
  }
  return out;
}

}  // namespace aigw::utils
