#include <codegate/cli/cli.h>

int main(int argc, char** argv)
{
    return codegate::cli::run(argc, argv);
}
