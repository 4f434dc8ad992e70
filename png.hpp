# pragma once
# include <array>
# include <algorithm>
# include <iostream>
# include <string>
# include <cstdint>
# include <format>
# include <vector>
# include "chunk.hpp"
# include "chunk_type.hpp"
# include "errors.hpp"
# include "ihdr.hpp"
# include "utils.hpp"

namespace pngmsg {

const uint64_t STANDARD_HEADER_LENGTH = 8;
inline constexpr std::array<uint8_t, STANDARD_HEADER_LENGTH> STANDARD_HEADER = {
  0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
};

class PNG{
private:
  std::vector<Chunk> chunks_;
public:
  PNG(void) = default;
  explicit PNG(std::vector<Chunk> chunks) : chunks_(std::move(chunks)) {}
  static PNG from_bytes(const std::vector<char>& data);
  static PNG from_file(const std::string& path);
  static const std::array<uint8_t, STANDARD_HEADER_LENGTH>& header(void) { return STANDARD_HEADER; }
  const std::vector<Chunk>& chunks(void) const { return chunks_; }
  void append_chunk(Chunk chunk);
  Chunk remove_first_chunk(const ChunkType& type);
  const Chunk* chunk_by_type(const ChunkType& type) const;
  std::vector<char> as_bytes(void) const;
  void write(const std::string& path) const;
  void debug(std::ostream& os = std::cout) const;
  bool operator==(const PNG&) const = default;
};

inline PNG PNG::from_bytes(const std::vector<char>& data){
  // PNGシグネチャの確認
  if(data.size() < STANDARD_HEADER_LENGTH ||
     !std::equal(STANDARD_HEADER.begin(), STANDARD_HEADER.end(), data.begin(),
       [](uint8_t expected, char actual) { return expected == static_cast<uint8_t>(actual); })){
    throw Error(ErrorKind::InvalidSignature, "Not a PNG file (signature mismatch)");
  }
  // バッファの終わりまでチャンクを読み込む (IEND以降も保持)
  std::vector<Chunk> chunks;
  uint64_t binary_idx = STANDARD_HEADER_LENGTH;
  while(binary_idx < data.size()){
    Chunk chunk = Chunk::parse(data, binary_idx);
    binary_idx += chunk.size();
    chunks.push_back(std::move(chunk));
  }
  return PNG{std::move(chunks)};
}

inline PNG PNG::from_file(const std::string& path){
  return from_bytes(utils::read_file(path));
}

// IENDがあればその直前に、なければ末尾に追加
inline void PNG::append_chunk(Chunk chunk){
  auto iend = std::find_if(chunks_.begin(), chunks_.end(),
    [](const Chunk& c){
      return c.type_string() == "IEND";
    }
  );
  chunks_.insert(iend, std::move(chunk));
}

inline Chunk PNG::remove_first_chunk(const ChunkType& type){
  auto it = std::find_if(chunks_.begin(), chunks_.end(),
    [&type](const Chunk& c){
      return c.type() == type;
    }
  );
  if(it == chunks_.end()){
    throw Error(ErrorKind::ChunkNotFound,
      std::format("Chunk of type {} was not found", type.to_string()));
  }
  Chunk removed = std::move(*it);
  chunks_.erase(it);
  return removed;
}

inline const Chunk* PNG::chunk_by_type(const ChunkType& type) const{
  for(const Chunk& chunk : chunks_){
    if(chunk.type() == type)
      return &chunk;
  }
  return nullptr;
}

inline std::vector<char> PNG::as_bytes(void) const{
  std::vector<char> out(STANDARD_HEADER.begin(), STANDARD_HEADER.end());
  for(const Chunk& chunk : chunks_){
    const std::vector<char> bytes = chunk.as_bytes();
    out.insert(out.end(), bytes.begin(), bytes.end());
  }
  return out;
}

inline void PNG::write(const std::string& path) const{
  utils::write_file(path, as_bytes());
}

inline void PNG::debug(std::ostream& os) const{
  os << "signature:";
  for(const uint8_t b : STANDARD_HEADER){
    os << std::format(" {:02X}", b);
  }
  os << std::endl;
  for(size_t i = 0; i < chunks_.size(); i++){
    const Chunk& chunk = chunks_[i];
    os << std::format("[{}] {}", i, chunk.type_string()) << std::endl;
    chunk.debug(os);
    if(chunk.type_string() == "IHDR" && chunk.length() >= IHDR::DATA_LENGTH){
      IHDR::parse(chunk).debug(os);
    }
  }
  os << std::format("chunks: {}", chunks_.size()) << std::endl;
}

} // namespace pngmsg
