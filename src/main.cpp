#include "cli.h"

int main(int argc,char**argv) {
    return primeseq::run_cli(argc,argv);
}
