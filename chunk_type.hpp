# pragma once
# include <array>
# include <compare>
# include <cstdint>
# include <format>
# include <string>
# include "errors.hpp"
# include "utils.hpp"

namespace pngmsg {

// 4バイトのチャンクタイプ
// 各バイトのbit5(0x20)がチャンクの性質を表す
//   [0] 0:critical   1:ancillary
//   [1] 0:public     1:private
//   [2] 0:予約(必ず0)
//   [3] 0:unsafe     1:safe to copy
class ChunkType{
private:
  std::array<uint8_t, 4> bytes_;
  static constexpr uint8_t PROPERTY_BIT = 0x20;
public:
  explicit ChunkType(const std::array<uint8_t, 4>& bytes) : bytes_(bytes) {}
  static ChunkType from_bytes(const std::array<uint8_t, 4>& bytes);
  static ChunkType from_string(const std::string& s);
  const std::array<uint8_t, 4>& bytes(void) const { return bytes_; }
  std::string to_string(void) const;
  bool is_valid(void) const;
  bool is_critical(void) const;
  bool is_public(void) const;
  bool is_reserved_bit_valid(void) const;
  bool is_safe_to_copy(void) const;
  bool operator==(const ChunkType&) const = default;
  auto operator<=>(const ChunkType&) const = default;
};

inline ChunkType ChunkType::from_bytes(const std::array<uint8_t, 4>& bytes){
  return ChunkType{bytes};
}

// ユーザー入力用: 英字4文字のみ受け付ける
inline ChunkType ChunkType::from_string(const std::string& s){
  if(s.size() != 4){
    throw Error(ErrorKind::InvalidTypeLength,
      std::format("Invalid chunk type length: {}. Expected: 4", s.size()));
  }
  std::array<uint8_t, 4> bytes{};
  for(int i = 0; i < 4; i++){
    bytes[i] = static_cast<uint8_t>(s[i]);
    if(!utils::is_ascii_letter(bytes[i])){
      throw Error(ErrorKind::InvalidTypeChars,
        std::format("Invalid character in chunk type \"{}\" at position {}", s, i));
    }
  }
  return ChunkType{bytes};
}

inline std::string ChunkType::to_string(void) const{
  return std::string(bytes_.begin(), bytes_.end());
}

inline bool ChunkType::is_valid(void) const{
  for(const uint8_t b : bytes_){
    if(!utils::is_ascii_letter(b)) return false;
  }
  return is_reserved_bit_valid();
}

inline bool ChunkType::is_critical(void) const{
  return (bytes_[0] & PROPERTY_BIT) == 0;
}

inline bool ChunkType::is_public(void) const{
  return (bytes_[1] & PROPERTY_BIT) == 0;
}

inline bool ChunkType::is_reserved_bit_valid(void) const{
  return (bytes_[2] & PROPERTY_BIT) == 0;
}

inline bool ChunkType::is_safe_to_copy(void) const{
  return (bytes_[3] & PROPERTY_BIT) != 0;
}

} // namespace pngmsg
