#include "certvet/cli.hpp"

int main(int argc, char *argv[])
{
    return certvet::cli::run(argc, argv);
}
