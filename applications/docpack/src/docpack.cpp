#include "pack_command.hpp"

int main(int argc, char* argv[]) {
    return DocPack::PackCommand::Run(argc, argv);
}
