#include <cstdlib>
#include <exception>
#include <iostream>
#include <string_view>

#include <pathrouter/pathrouter.hpp>

using namespace pathrouter;

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <path> [<path>...]\n";
    return EXIT_FAILURE;
  }

  try {
    const auto router = PathRouter<std::string_view>::builder()
                            .add("/", "home")
                            .add("/about", "about")
                            .add("/raw/{file}", "raw file")
                            .add(R"(/results/{uuid:[\w-]+}.json)", "results")
                            .build();

    for (int argPos = 1; argPos < argc; ++argPos) {
      const std::string_view path(argv[argPos]);
      const auto match = router.find(path);
      if (!match) {
        std::cout << path << " -> not found\n";
        continue;
      }
      std::cout << path << " -> " << match->value() << " (" << match->pathPattern().source() << ")\n";
      for (const auto &[name, value] : match->variables()) {
        std::cout << "  " << name << " = " << value << '\n';
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "Invalid route configuration: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
