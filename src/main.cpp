#include <treecopy/cli.hpp>

int main(int argc, char** argv) {
    return treecopy::run(argc, argv);
}
