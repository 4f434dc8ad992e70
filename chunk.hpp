# pragma once
# include <array>
# include <iostream>
# include <string>
# include <cstdint>
# include <format>
# include <utility>
# include <vector>
# include "chunk_type.hpp"
# include "errors.hpp"
# include "utils.hpp"

namespace pngmsg {

const uint64_t BYTE_LENGTH = 4;
const uint64_t BYTE_TYPE = 4;
const uint64_t BYTE_CRC = 4;
const uint32_t MAX_CHUNK_LENGTH = UINT32_C(0x7FFFFFFF);  // 2^31-1

// 長さ(4) + タイプ(4) + データ(length) + CRC(4)
class Chunk{
private:
  ChunkType type_;
  std::vector<char> data_;
  uint32_t crc_ = 0;
public:
  Chunk(const ChunkType& type, std::vector<char> data);
  static Chunk parse(const std::vector<char>& bytes, size_t start = 0);
  uint32_t length(void) const { return static_cast<uint32_t>(data_.size()); }
  const ChunkType& type(void) const { return type_; }
  std::string type_string(void) const { return type_.to_string(); }
  const std::vector<char>& data(void) const { return data_; }
  std::string data_as_string(void) const;
  uint32_t crc(void) const { return crc_; }
  uint64_t size(void) const { return BYTE_LENGTH + BYTE_TYPE + length() + BYTE_CRC; }
  std::vector<char> as_bytes(void) const;
  void debug(std::ostream& os = std::cout) const;
  bool operator==(const Chunk&) const = default;
};

inline Chunk::Chunk(const ChunkType& type, std::vector<char> data)
  : type_(type), data_(std::move(data)){
  if(data_.size() > MAX_CHUNK_LENGTH){
    throw Error(ErrorKind::ChunkTooLarge,
      std::format("Chunk data too large: {} bytes (max {})", data_.size(), MAX_CHUNK_LENGTH));
  }
  this->crc_ = utils::calc_crc(type_.bytes().data(), data_);
}

// bytes[start]から1チャンク読み込む
inline Chunk Chunk::parse(const std::vector<char>& bytes, size_t start){
  const uint64_t available = start <= bytes.size() ? bytes.size() - start : 0;
  if(available < BYTE_LENGTH + BYTE_TYPE + BYTE_CRC){
    throw Error(ErrorKind::InsufficientData,
      std::format("Chunk header needs {} bytes, only {} remain", BYTE_LENGTH + BYTE_TYPE + BYTE_CRC, available));
  }
  // チャンクのデータ長を取得
  const uint32_t length = utils::vecchar2int(bytes, start);
  const uint64_t total = BYTE_LENGTH + BYTE_TYPE + length + BYTE_CRC;
  if(available < total){
    throw Error(ErrorKind::InsufficientData,
      std::format("Chunk declares {} data bytes but only {} bytes remain", length, available - BYTE_LENGTH - BYTE_TYPE - BYTE_CRC));
  }
  if(length > MAX_CHUNK_LENGTH){
    throw Error(ErrorKind::ChunkTooLarge,
      std::format("Chunk length field too large: {} (max {})", length, MAX_CHUNK_LENGTH));
  }
  // チャンク名を取得 (英字チェックはしない)
  std::array<uint8_t, 4> type_bytes{};
  for(size_t i = 0; i < BYTE_TYPE; i++){
    type_bytes[i] = static_cast<uint8_t>(bytes[start + BYTE_LENGTH + i]);
  }
  // チャンクのデータを取得
  const size_t data_start = start + BYTE_LENGTH + BYTE_TYPE;
  std::vector<char> data(bytes.begin() + data_start, bytes.begin() + data_start + length);
  Chunk chunk{ChunkType::from_bytes(type_bytes), std::move(data)};
  // CRCディジットチェック
  const uint32_t stored_crc = utils::vecchar2int(bytes, data_start + length);
  if(stored_crc != chunk.crc()){
    throw Error(ErrorKind::CrcMismatch,
      std::format("CRC mismatch in {} chunk: stored {:08X}, computed {:08X}", chunk.type_string(), stored_crc, chunk.crc()));
  }
  return chunk;
}

inline std::string Chunk::data_as_string(void) const{
  if(!utils::is_valid_utf8(data_)){
    throw Error(ErrorKind::Utf8DecodeError,
      std::format("Data of {} chunk is not valid UTF-8", type_string()));
  }
  return std::string(data_.begin(), data_.end());
}

inline std::vector<char> Chunk::as_bytes(void) const{
  std::vector<char> out;
  out.reserve(size());
  const std::vector<char> length_data = utils::int2vecchar(length());
  out.insert(out.end(), length_data.begin(), length_data.end());
  out.insert(out.end(), type_.bytes().begin(), type_.bytes().end());
  out.insert(out.end(), data_.begin(), data_.end());
  const std::vector<char> crc_bytes = utils::int2vecchar(crc_);
  out.insert(out.end(), crc_bytes.begin(), crc_bytes.end());
  return out;
}

inline void Chunk::debug(std::ostream& os) const{
  os << std::format("  length: {} (0x{:08X})", this->length(), this->length()) << std::endl;
  os << std::format("  crc   : {:08X}", this->crc_) << std::endl;
  os << std::format("  flags : {}, {}, {}",
    type_.is_critical() ? "critical" : "ancillary",
    type_.is_public() ? "public" : "private",
    type_.is_safe_to_copy() ? "safe-to-copy" : "unsafe-to-copy") << std::endl;
  // クリティカルチャンクの中身はテキストとして出さない
  if(!type_.is_critical() && utils::is_valid_utf8(data_)){
    os << std::format("  data  : \"{}\"", utils::escape_control(std::string(data_.begin(), data_.end()))) << std::endl;
  }else{
    os << std::format("  data  : <{} bytes>", this->length()) << std::endl;
  }
}

} // namespace pngmsg
