// FILE: src/cli/print_cli_help.cpp
#include "cli/print_cli_help.hpp"

#include <iostream>

void print_cli_help() {
  std::cout
      << "Usage: thumbkit [options] <file>...\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "  -o, --output <dir>         Directory for generated thumbnails\n"
      << "  -s, --size <N|WxH>         Maximum thumbnail size\n"
      << "  -f, --format <ext>         Output image format (png, jpg, ...)\n"
      << "  -l, --list                 List registered renderers and exit\n"
      << "      --config <file>        Use a specific configuration file\n"
      << "      --plugins <dir>        Also scan <dir> for plugins (dir/** recurses)\n"
      << "      --manifest <file>      Also register providers from a manifest\n"
      << "      --parallel             Probe renderers concurrently\n"
      << "      --report <file>        Write a JSON report of the run\n"
      << std::endl;
}
