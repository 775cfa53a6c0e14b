//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Entry point for the `classlens-dis` binary.
//
//===----------------------------------------------------------------------===//

#include "tools/classlens-dis/driver.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    return classlens::tools::dis::runCLI(argc, argv, std::cout, std::cerr);
}
