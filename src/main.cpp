#include "ControlFlow.hpp"

int main(int argc, char* argv[])
{
    ControlFlow Flow;
    return Flow.Run(argc, argv);
}
