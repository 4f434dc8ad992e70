# pragma once
# include <string>
# include <fstream>
# include <cstdint>
# include <format>
# include <vector>
# include <algorithm>
# include <cctype>
# include <filesystem>
# include <random>
# include <system_error>
# include <zlib.h>
# include "errors.hpp"

namespace pngmsg::utils {

// 大文字小文字区別しない文字列比較
inline bool equal_stri(const std::string& s1, const std::string& s2){
  if(s1.size() != s2.size()) return false;
  return std::equal(s1.begin(), s1.end(), s2.begin(),
    [](char a, char b) {
      return std::toupper(static_cast<unsigned char>(a)) == std::toupper(static_cast<unsigned char>(b));
    }
  );
}

inline bool is_ascii_letter(uint8_t c){
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

// チャンクタイプとデータを続けてCRC計算 (zlib)
inline uint32_t calc_crc(const uint8_t* type, const std::vector<char>& data){
  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32(crc, reinterpret_cast<const Bytef*>(type), 4);
  if(!data.empty()){
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()));
  }
  return static_cast<uint32_t>(crc);
}

// uint32_t -> ビッグエンディアン4バイト
inline std::vector<char> int2vecchar(const uint32_t value){
  std::vector<char> bytes(4);
  for(int i = 0; i < 4; i++){
    bytes[i] = static_cast<char>((value >> (8 * (3 - i))) & 0xFF);
  }
  return bytes;
}

// ビッグエンディアン4バイト -> uint32_t
inline uint32_t vecchar2int(const std::vector<char>& data, size_t start){
  uint32_t value = 0;
  for(int i = 0; i < 4; i++){
    value = (value << 8) | static_cast<uint8_t>(data[start + i]);
  }
  return value;
}

// UTF-8として正しいバイト列か
inline bool is_valid_utf8(const std::vector<char>& data){
  size_t i = 0;
  const size_t n = data.size();
  while(i < n){
    const uint8_t c = static_cast<uint8_t>(data[i]);
    size_t extra = 0;
    uint32_t code_point = 0;
    uint32_t min_code_point = 0;
    if(c < 0x80){
      i++;
      continue;
    }else if((c & 0xE0) == 0xC0){
      extra = 1; code_point = c & 0x1F; min_code_point = 0x80;
    }else if((c & 0xF0) == 0xE0){
      extra = 2; code_point = c & 0x0F; min_code_point = 0x800;
    }else if((c & 0xF8) == 0xF0){
      extra = 3; code_point = c & 0x07; min_code_point = 0x10000;
    }else{
      return false;
    }
    if(i + extra >= n) return false;  // 途中で終わっている
    for(size_t j = 1; j <= extra; j++){
      const uint8_t cc = static_cast<uint8_t>(data[i + j]);
      if((cc & 0xC0) != 0x80) return false;
      code_point = (code_point << 6) | (cc & 0x3F);
    }
    if(code_point < min_code_point) return false;  // 冗長表現
    if(code_point >= 0xD800 && code_point <= 0xDFFF) return false;  // サロゲート
    if(code_point > 0x10FFFF) return false;
    i += extra + 1;
  }
  return true;
}

// 表示用に制御文字を \xNN でエスケープする
inline std::string escape_control(const std::string& text){
  std::string out;
  out.reserve(text.size());
  for(const char c : text){
    const uint8_t b = static_cast<uint8_t>(c);
    if(c == '\\'){
      out += "\\\\";
    }else if(c == '"'){
      out += "\\\"";
    }else if(b < 0x20 || b == 0x7F){
      out += std::format("\\x{:02X}", b);
    }else{
      out += c;
    }
  }
  return out;
}

// ファイル全体をバイナリ読み込み
inline std::vector<char> read_file(const std::string& path){
  std::ifstream ifs(path, std::ios::in | std::ios::binary);
  if(!ifs){
    throw Error(ErrorKind::IoError, std::format("Failed to open input file: {}", path));
  }
  ifs.seekg(0, std::ios::end);
  const std::streamoff size = ifs.tellg();
  if(size < 0){
    throw Error(ErrorKind::IoError, std::format("Failed to get file size: {}", path));
  }
  ifs.seekg(0);
  std::vector<char> data(static_cast<size_t>(size));
  if(!ifs.read(data.data(), size)){
    throw Error(ErrorKind::IoError, std::format("Failed to read input file: {}", path));
  }
  return data;
}

// 既存ファイルと重ならない一時ファイル名を作る
inline std::string unique_tmp_path(const std::string& path){
  std::random_device rd;
  for(int attempt = 0; attempt < 100; attempt++){
    const std::string candidate = std::format("{}.{:08x}.tmp", path, rd());
    if(!std::filesystem::exists(candidate)) return candidate;
  }
  throw Error(ErrorKind::IoError, std::format("Failed to create a temporary file name for {}", path));
}

// 一時ファイルに書いてからリネーム
// 上書きする場合は元ファイルのパーミッションを引き継ぐ
inline void write_file(const std::string& path, const std::vector<char>& data){
  const std::string tmp_path = unique_tmp_path(path);
  {
    std::ofstream ofs(tmp_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if(!ofs){
      throw Error(ErrorKind::IoError, std::format("Failed to open output file: {}", tmp_path));
    }
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if(!ofs){
      ofs.close();
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      throw Error(ErrorKind::IoError, std::format("Failed to write output file: {}", tmp_path));
    }
  }
  std::error_code ec;
  const std::filesystem::file_status target = std::filesystem::status(path, ec);
  if(std::filesystem::exists(target)){
    std::filesystem::permissions(tmp_path, target.permissions(), std::filesystem::perm_options::replace, ec);
    if(ec){
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      throw Error(ErrorKind::IoError, std::format("Failed to copy permissions of {}: {}", path, ec.message()));
    }
  }
  ec.clear();
  std::filesystem::rename(tmp_path, path, ec);
  if(ec){
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw Error(ErrorKind::IoError, std::format("Failed to replace {}: {}", path, ec.message()));
  }
}

} // namespace pngmsg::utils
