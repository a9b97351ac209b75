// cli_args.cpp
#include "cli_args.h"
#include "zkaes/errors.h"

#include <stdexcept>

namespace zkaes {

static size_t parse_blocks(const std::string& v){
    size_t pos = 0;
    unsigned long n = 0;
    try{
        n = std::stoul(v, &pos);
    }catch(const std::logic_error&){
        throw InputError("--blocks expects a positive integer, got '" + v + "'");
    }
    if(pos != v.size() || n == 0) throw InputError("--blocks expects a positive integer, got '" + v + "'");
    return n;
}

CliArgs parseCliArgs(int argc, const char* const* argv){
    if(argc<2) throw InputError("missing mode");
    CliArgs a;
    a.mode = argv[1];
    for(int i=2;i<argc;i++){
        const std::string s = argv[i];
        auto next = [&](){
            if(i+1>=argc) throw InputError(s + " needs a value");
            return std::string(argv[++i]);
        };
        if(s=="--debug") a.debug = true;
        else if(s=="--random") a.random = true;
        else if(s=="--public-plaintext") a.publicPlaintext = true;
        else if(s=="--key") a.key = next();
        else if(s=="--plaintext") a.plaintext = next();
        else if(s=="--ciphertext") a.ciphertext = next();
        else if(s=="--json") a.json = next();
        else if(s=="--blocks") a.blocks = parse_blocks(next());
        else throw InputError("unknown argument: " + s);
    }
    return a;
}

} // namespace zkaes
