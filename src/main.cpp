#include "quill/app/app.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  std::vector<std::string> arguments;
  for (int index = 1; index < argc; ++index) {
    arguments.emplace_back(argv[index] != nullptr ? argv[index] : "");
  }
  return quill::app::run(arguments, std::cin, std::cout, std::cerr);
}
