# pragma once
# include <iostream>
# include <string>
# include <format>
# include <variant>
# include <vector>
# include "args.hpp"
# include "chunk.hpp"
# include "chunk_type.hpp"
# include "errors.hpp"
# include "png.hpp"

namespace pngmsg::commands {

// 読み込み -> チャンク追加 -> 書き込み
// output_path が空なら元ファイルを上書きする
inline void encode(const std::string& path, const std::string& type_string,
                   const std::string& message, const std::string& output_path = ""){
  PNG png = PNG::from_file(path);
  const ChunkType type = ChunkType::from_string(type_string);
  png.append_chunk(Chunk{type, std::vector<char>(message.begin(), message.end())});
  png.write(output_path.empty() ? path : output_path);
}

inline std::string decode(const std::string& path, const std::string& type_string){
  const PNG png = PNG::from_file(path);
  const ChunkType type = ChunkType::from_string(type_string);
  const Chunk* chunk = png.chunk_by_type(type);
  if(chunk == nullptr){
    throw Error(ErrorKind::ChunkNotFound,
      std::format("Chunk of type {} was not found", type.to_string()));
  }
  return chunk->data_as_string();
}

inline Chunk remove(const std::string& path, const std::string& type_string){
  PNG png = PNG::from_file(path);
  const ChunkType type = ChunkType::from_string(type_string);
  Chunk removed = png.remove_first_chunk(type);
  png.write(path);
  return removed;
}

inline void print(const std::string& path, std::ostream& os = std::cout){
  PNG::from_file(path).debug(os);
}

// サブコマンドの実行と結果表示
class Handler{
private:
  std::ostream& os_;
public:
  explicit Handler(std::ostream& os) : os_(os) {}
  void operator()(const EncodeArgs& args) const{
    commands::encode(args.file_path, args.chunk_type, args.message, args.output_file);
    os_ << "Encoding successful!" << std::endl;
  }
  void operator()(const DecodeArgs& args) const{
    os_ << commands::decode(args.file_path, args.chunk_type) << std::endl;
  }
  void operator()(const RemoveArgs& args) const{
    const Chunk removed = commands::remove(args.file_path, args.chunk_type);
    os_ << std::format("Chunk removed! ({}, {} bytes)", removed.type_string(), removed.length()) << std::endl;
  }
  void operator()(const PrintArgs& args) const{
    commands::print(args.file_path, os_);
  }
  void operator()(const HelpArgs&) const{
    os_ << usage();
  }
};

inline void run(const Command& command, std::ostream& os = std::cout){
  std::visit(Handler{os}, command);
}

} // namespace pngmsg::commands
