# pragma once
# include <iostream>
# include <cstdint>
# include <format>
# include "chunk.hpp"
# include "errors.hpp"
# include "utils.hpp"

namespace pngmsg {

// IHDRチャンクの内容 (画素データは扱わない)
class IHDR{
private:
  uint32_t width_ = 0;
  uint32_t height_ = 0;
  uint8_t bit_depth_ = 0;
  uint8_t color_type_ = 0;
  uint8_t compression_method_ = 0;
  uint8_t filter_method_ = 0;
  uint8_t interlace_method_ = 0;
public:
  static constexpr uint32_t DATA_LENGTH = 13;
  static IHDR parse(const Chunk& chunk);
  uint32_t width(void) const { return width_; }
  uint32_t height(void) const { return height_; }
  uint8_t bit_depth(void) const { return bit_depth_; }
  uint8_t color_type(void) const { return color_type_; }
  uint8_t compression_method(void) const { return compression_method_; }
  uint8_t filter_method(void) const { return filter_method_; }
  uint8_t interlace_method(void) const { return interlace_method_; }
  void debug(std::ostream& os = std::cout) const;
};

inline IHDR IHDR::parse(const Chunk& chunk){
  const std::vector<char>& data = chunk.data();
  if(data.size() < DATA_LENGTH){
    throw Error(ErrorKind::InsufficientData,
      std::format("IHDR needs {} bytes, got {}", DATA_LENGTH, data.size()));
  }
  IHDR ihdr;
  ihdr.width_ = utils::vecchar2int(data, 0);
  ihdr.height_ = utils::vecchar2int(data, 4);
  ihdr.bit_depth_ = static_cast<uint8_t>(data[8]);
  ihdr.color_type_ = static_cast<uint8_t>(data[9]);
  ihdr.compression_method_ = static_cast<uint8_t>(data[10]);
  ihdr.filter_method_ = static_cast<uint8_t>(data[11]);
  ihdr.interlace_method_ = static_cast<uint8_t>(data[12]);
  return ihdr;
}

inline void IHDR::debug(std::ostream& os) const{
  os << std::format("  width : {}", this->width_) << std::endl;
  os << std::format("  height: {}", this->height_) << std::endl;
  os << std::format("  bit_depth: {}, color_type: {}, interlace: {}",
    this->bit_depth_, this->color_type_, this->interlace_method_) << std::endl;
}

} // namespace pngmsg
