#include <showlink/cli.h>
#include <showlink/exit_codes.h>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);
    return showlink::RunReconcile(arguments, std::cout);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    const auto code = showlink::ExitCodeForException(ex);
    if (code == showlink::kExitUsageError) {
      showlink::PrintUsage(std::cerr);
    }
    return code;
  }
}
