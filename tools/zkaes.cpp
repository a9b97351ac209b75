// zkaes.cpp
// Command-line driver for the AES-128 circuit.
//
//   ./zkaes -p (--key HEX --plaintext HEX | --random) [--blocks N] [--public-plaintext] [--json FILE] [--debug]
//   ./zkaes -v --key HEX --plaintext HEX --ciphertext HEX [--public-plaintext] [--debug]
//
// The plaintext may hold several 16-byte blocks; all are encrypted under the
// same key. Exit codes: 0 ok/accept, 1 usage or input error, 2 unsatisfied
// or reject, 3 internal error.

#include "cli_args.h"
#include "zkaes/aes128_circuit.h"
#include "zkaes/errors.h"
#include "zkaes/hex.h"
#include "zkaes/log.h"
#include "zkaes/mock_prover.h"
#include "zkaes/reference_aes.h"

#include <nlohmann/json.hpp>
#include <openssl/rand.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using ordered_json = nlohmann::ordered_json;
using namespace zkaes;

static std::vector<uint8_t> random_bytes(size_t n){
    std::vector<uint8_t> out(n);
    if(RAND_bytes(out.data(), (int)n) != 1) throw std::runtime_error("RAND_bytes failed");
    return out;
}

static std::vector<Block> split_blocks(const std::vector<uint8_t>& bytes, const char* what){
    if(bytes.empty() || bytes.size() % kBlockBytes != 0)
        throw InputError(std::string(what) + " must be a non-empty multiple of 16 bytes, got " +
                         std::to_string(bytes.size()));
    std::vector<Block> out(bytes.size() / kBlockBytes);
    for(size_t i=0;i<bytes.size();i++) out[i / kBlockBytes][i % kBlockBytes] = bytes[i];
    return out;
}

static std::string hex_of_block(const Block& b){
    return hexOfBytes(b.data(), b.size());
}

static ordered_json stats_json(const CircuitStats& s){
    ordered_json j;
    j["private_cells"] = s.privateCells;
    j["public_cells"] = s.publicCells;
    j["gate_definitions"] = s.gateDefinitions;
    j["gate_instances"] = s.gateInstances;
    j["tables"] = s.tables;
    j["table_rows"] = s.tableRows;
    j["lookups"] = s.lookups;
    j["copies"] = s.copies;
    ordered_json usage;
    for(const auto& kv : s.gateUsage) usage[kv.first] = kv.second;
    j["gate_usage"] = usage;
    return j;
}

static void write_json(const std::string& path, const ordered_json& j){
    std::ofstream f(path);
    if(!f.is_open()) throw std::runtime_error("cannot open " + path + " for writing");
    f << j.dump(2) << "\n";
    if(!f) throw std::runtime_error("write failed: " + path);
}

static void print_failures(const std::vector<VerifyFailure>& failures){
    const size_t shown = failures.size() < 10 ? failures.size() : 10;
    for(size_t i=0;i<shown;i++) fprintf(stderr, "  %s\n", failures[i].describe().c_str());
    if(failures.size() > shown) fprintf(stderr, "  ... %zu more\n", failures.size() - shown);
}

static int cmd_prove(const CliArgs& a){
    std::vector<uint8_t> key, pt;
    if(a.random){
        const size_t blocks = a.blocks ? a.blocks : 1;
        key = random_bytes(kBlockBytes);
        pt = random_bytes(blocks * kBlockBytes);
    }else{
        if(a.key.empty() || a.plaintext.empty()) throw InputError("-p needs --key and --plaintext, or --random");
        key = parseHexBytes(a.key);
        pt = parseHexBytes(a.plaintext);
    }

    const Block k = toBlock(key, "key");
    const std::vector<Block> pts = split_blocks(pt, "plaintext");
    if(a.blocks && a.blocks != pts.size())
        throw InputError("--blocks " + std::to_string(a.blocks) + " does not match the " +
                         std::to_string(pts.size()) + " plaintext block(s)");

    Aes128Options opt;
    opt.blocks = pts.size();
    opt.publicPlaintext = a.publicPlaintext;

    AesTrace trace = generateWitness(k, pts);
    for(size_t b=0;b<pts.size();b++){
        const Block expect = referenceEncrypt(k, pts[b]);
        if(expect != trace.blocks[b].ciphertext)
            throw std::runtime_error("witness ciphertext of block " + std::to_string(b) +
                                     " disagrees with OpenSSL: " + hex_of_block(expect));
    }
    dbg("OpenSSL cross-check passed");

    Aes128Circuit circuit(opt);
    MockProver prover;
    circuit.synthesize(prover);
    circuit.assign(prover, trace);
    const std::vector<Fr> instance = circuit.publicInputs(trace);
    const std::vector<VerifyFailure> failures = prover.verify(instance);
    const CircuitStats st = prover.stats();

    printf("key:        %s\n", hex_of_block(k).c_str());
    for(size_t b=0;b<pts.size();b++){
        printf("block %zu\n", b);
        printf("  plaintext:  %s\n", hex_of_block(pts[b]).c_str());
        printf("  ciphertext: %s\n", hex_of_block(trace.blocks[b].ciphertext).c_str());
    }
    printf("cells: %zu private, %zu public\n", st.privateCells, st.publicCells);
    printf("gates: %zu instances of %zu definitions\n", st.gateInstances, st.gateDefinitions);
    printf("lookups: %zu into %zu table(s), %zu rows\n", st.lookups, st.tables, st.tableRows);
    printf("copies: %zu\n", st.copies);
    printf("satisfied: %s\n", failures.empty() ? "yes" : "no");

    if(!a.json.empty()){
        ordered_json j;
        j["public_plaintext"] = opt.publicPlaintext;
        j["blocks"] = pts.size();
        ordered_json cts = ordered_json::array();
        for(const auto& bt : trace.blocks) cts.push_back(hex_of_block(bt.ciphertext));
        j["ciphertext"] = cts;
        if(opt.publicPlaintext){
            ordered_json ps = ordered_json::array();
            for(const auto& p : pts) ps.push_back(hex_of_block(p));
            j["plaintext"] = ps;
        }
        ordered_json pub = ordered_json::array();
        for(const auto& x : instance) pub.push_back(frToHex(x));
        j["public_inputs"] = pub;
        j["stats"] = stats_json(st);
        j["satisfied"] = failures.empty();
        write_json(a.json, j);
        printf("report written to %s\n", a.json.c_str());
    }

    if(!failures.empty()){
        fprintf(stderr, "Circuit not satisfied: %zu failure(s)\n", failures.size());
        print_failures(failures);
        return 2;
    }
    return 0;
}

static int cmd_verify(const CliArgs& a){
    if(a.key.empty() || a.plaintext.empty() || a.ciphertext.empty())
        throw InputError("-v needs --key, --plaintext and --ciphertext");

    const Block k = toBlock(parseHexBytes(a.key), "key");
    const std::vector<Block> pts = split_blocks(parseHexBytes(a.plaintext), "plaintext");
    const std::vector<Block> cts = split_blocks(parseHexBytes(a.ciphertext), "ciphertext");
    if(cts.size() != pts.size())
        throw InputError("ciphertext has " + std::to_string(cts.size()) + " block(s), plaintext has " +
                         std::to_string(pts.size()));

    Aes128Options opt;
    opt.blocks = pts.size();
    opt.publicPlaintext = a.publicPlaintext;

    Aes128Circuit circuit(opt);
    MockProver prover;
    circuit.synthesize(prover);
    circuit.assign(prover, generateWitness(k, pts));

    const std::vector<VerifyFailure> failures = prover.verify(circuit.publicInputs(cts, pts));
    if(failures.empty()){
        printf("ACCEPT\n");
        return 0;
    }
    printf("REJECT\n");
    if(debugEnabled()) print_failures(failures);
    return 2;
}

static void usage(){
    fprintf(stderr,
        "Usage:\n"
        "  ./zkaes -p (--key HEX --plaintext HEX | --random) [--blocks N] [--public-plaintext] [--json FILE] [--debug]\n"
        "  ./zkaes -v --key HEX --plaintext HEX --ciphertext HEX [--public-plaintext] [--debug]\n");
}

int main(int argc, char** argv){
    CliArgs a;
    try{
        a = parseCliArgs(argc, argv);
    }catch(const InputError& e){
        fprintf(stderr, "%s\n", e.what());
        usage();
        return 1;
    }
    if(a.debug) setDebug(true);

    try{
        if(a.mode=="-p") return cmd_prove(a);
        if(a.mode=="-v") return cmd_verify(a);
        fprintf(stderr, "Unknown mode: %s\n", a.mode.c_str());
        usage();
        return 1;
    }catch(const InputError& e){
        fprintf(stderr, "Input error: %s\n", e.what());
        return 1;
    }catch(const UnsatisfiedError& e){
        fprintf(stderr, "Circuit not satisfied: %s\n", e.what());
        print_failures(e.failures());
        return 2;
    }catch(const std::exception& e){
        fprintf(stderr, "Internal error: %s\n", e.what());
        return 3;
    }
}
