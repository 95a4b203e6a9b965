#include <tsbase/cli/Driver.hpp>
#include <tsbase/cli/Options.hpp>

int main(int argc, char** argv) {
    return tsbase::cli::run(tsbase::cli::parse_options(argc, argv));
}
