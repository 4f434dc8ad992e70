# pragma once
# include <stdexcept>
# include <string>

namespace pngmsg {

// エラーの種類
enum class ErrorKind{
  InvalidSignature,  // PNGシグネチャ不一致
  InsufficientData,  // チャンクが宣言する長さに対してデータが足りない
  CrcMismatch,       // CRC不一致
  InvalidTypeLength, // チャンクタイプが4バイトでない
  InvalidTypeChars,  // チャンクタイプに英字以外が含まれる
  Utf8DecodeError,   // UTF-8として解釈できない
  ChunkNotFound,     // 指定タイプのチャンクが存在しない
  ChunkTooLarge,     // データ長が2^31-1を超える
  IoError,           // ファイル入出力の失敗
  InvalidArguments   // コマンドライン引数の誤り
};

inline const char* to_string(ErrorKind kind){
  switch(kind){
    case ErrorKind::InvalidSignature:  return "InvalidSignature";
    case ErrorKind::InsufficientData:  return "InsufficientData";
    case ErrorKind::CrcMismatch:       return "CrcMismatch";
    case ErrorKind::InvalidTypeLength: return "InvalidTypeLength";
    case ErrorKind::InvalidTypeChars:  return "InvalidTypeChars";
    case ErrorKind::Utf8DecodeError:   return "Utf8DecodeError";
    case ErrorKind::ChunkNotFound:     return "ChunkNotFound";
    case ErrorKind::ChunkTooLarge:     return "ChunkTooLarge";
    case ErrorKind::IoError:           return "IoError";
    case ErrorKind::InvalidArguments:  return "InvalidArguments";
  }
  return "Unknown";
}

class Error : public std::runtime_error{
private:
  ErrorKind kind_;
public:
  Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}
  ErrorKind kind(void) const { return kind_; }
};

} // namespace pngmsg
