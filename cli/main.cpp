// uishadec - Entry Point

#include <uishade/cli.h>

int main(int argc, char** argv) {
    return uishade::cli::handleCommand(argc, argv);
}
