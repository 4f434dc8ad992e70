# pragma once
# include <string>
# include <format>
# include <variant>
# include <vector>
# include "errors.hpp"
# include "utils.hpp"

namespace pngmsg {

struct EncodeArgs{
  std::string file_path;
  std::string chunk_type;
  std::string message;
  std::string output_file;  // 空なら file_path を上書き
};

struct DecodeArgs{
  std::string file_path;
  std::string chunk_type;
};

struct RemoveArgs{
  std::string file_path;
  std::string chunk_type;
};

struct PrintArgs{
  std::string file_path;
};

struct HelpArgs{};

using Command = std::variant<EncodeArgs, DecodeArgs, RemoveArgs, PrintArgs, HelpArgs>;

inline const char* usage(void){
  return
    "usage: pngmsg <command> [args]\n"
    "  encode [-o|--output <out-file>] [--] <file> <chunk-type> <message>\n"
    "  decode <file> <chunk-type>\n"
    "  remove <file> <chunk-type>\n"
    "  print  <file>\n"
    "  help\n";
}

namespace detail {

inline void expect_count(const std::string& command, const std::vector<std::string>& positional, size_t count){
  if(positional.size() != count){
    throw Error(ErrorKind::InvalidArguments,
      std::format("{} expects {} argument(s), got {}", command, count, positional.size()));
  }
}

} // namespace detail

inline Command parse_args(const std::vector<std::string>& args){
  if(args.empty()){
    throw Error(ErrorKind::InvalidArguments, "No command given");
  }
  const std::string& command = args[0];
  if(utils::equal_stri(command, "help") || command == "-h" || command == "--help"){
    return HelpArgs{};
  }
  // オプションと位置引数を分ける ("--" 以降はすべて位置引数)
  std::vector<std::string> positional;
  std::string output_file;
  bool has_output = false;
  bool options_done = false;
  for(size_t i = 1; i < args.size(); i++){
    if(!options_done && args[i] == "--"){
      options_done = true;
    }else if(!options_done && (args[i] == "-o" || args[i] == "--output")){
      if(i + 1 >= args.size()){
        throw Error(ErrorKind::InvalidArguments, std::format("{} requires a file path", args[i]));
      }
      if(has_output){
        throw Error(ErrorKind::InvalidArguments, std::format("{} given more than once", args[i]));
      }
      output_file = args[++i];
      has_output = true;
    }else{
      positional.push_back(args[i]);
    }
  }
  if(has_output && !utils::equal_stri(command, "encode")){
    throw Error(ErrorKind::InvalidArguments, "--output is only valid for encode");
  }
  if(has_output && output_file.empty()){
    throw Error(ErrorKind::InvalidArguments, "--output requires a non-empty file path");
  }
  if(utils::equal_stri(command, "encode")){
    detail::expect_count("encode", positional, 3);
    return EncodeArgs{positional[0], positional[1], positional[2], output_file};
  }
  if(utils::equal_stri(command, "decode")){
    detail::expect_count("decode", positional, 2);
    return DecodeArgs{positional[0], positional[1]};
  }
  if(utils::equal_stri(command, "remove")){
    detail::expect_count("remove", positional, 2);
    return RemoveArgs{positional[0], positional[1]};
  }
  if(utils::equal_stri(command, "print")){
    detail::expect_count("print", positional, 1);
    return PrintArgs{positional[0]};
  }
  throw Error(ErrorKind::InvalidArguments, std::format("Unknown command: {}", command));
}

inline Command parse_args(int argc, char* argv[]){
  std::vector<std::string> args;
  for(int i = 1; i < argc; i++){
    args.emplace_back(argv[i]);
  }
  return parse_args(args);
}

} // namespace pngmsg
