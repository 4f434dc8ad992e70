# include <iostream>
# include <format>
# include "args.hpp"
# include "commands.hpp"
# include "errors.hpp"

int main(int argc, char* argv[]){
  try{
    const pngmsg::Command command = pngmsg::parse_args(argc, argv);
    pngmsg::commands::run(command);
  }catch(const pngmsg::Error& e){
    std::cerr << std::format("error: {}", e.what()) << std::endl;
    if(e.kind() == pngmsg::ErrorKind::InvalidArguments){
      std::cerr << pngmsg::usage();
    }
    return 1;
  }catch(const std::exception& e){
    std::cerr << std::format("error: {}", e.what()) << std::endl;
    return 1;
  }
  return 0;
}
