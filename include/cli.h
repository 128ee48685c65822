#pragma once

namespace primeseq {

int run_cli(int argc,char**argv);

}
