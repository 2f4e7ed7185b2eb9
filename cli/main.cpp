// Vitrail - Entry Point

#include <vitrail/cli/cli.h>

int main(int argc, char** argv) {
    return vitrail::cli::handleCommand(argc, argv);
}
