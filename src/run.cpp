#include "discolib/core/solver.hpp"

int main(int argc, char *argv[]) {
    // 1. Instantiate the driver
    discolib::DiscoSolver solver;

    // 2. Initialize (command line, YAML configuration, catalog)
    int status = solver.init(argc, argv);

    // --help, bad arguments or an unreadable configuration end here
    if (status != discolib::DiscoSolver::CONTINUE) return status;

    // 3. Execute the selected subcommand
    return solver.run();
}
