// cppcheck-suppress-file missingIncludeSystem
#include "commands.hpp"

int main(int argc, char** argv)
{
    return capkern::run_cli(argc, argv);
}
