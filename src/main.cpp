#include "factoryq/core/solver.hpp"

int main(int argc, char *argv[]) {
    // 1. Instantiate the driver
    factoryq::FactoryQSolver solver;

    // 2. Initialize (command line and scenario file)
    int status = solver.init(argc, argv);

    // --help prints and exits cleanly; parse or load errors keep their code
    if (status < 0) return 0;
    if (status > 0) return status;

    // 3. Train, evaluate or test
    return solver.run();
}
