// constraint_system.h
//
// Backend seam for PLONKish circuits: witness/instance cells, custom gates,
// fixed lookup tables and copy constraints. The AES circuit is written
// against this interface only; a proving system (or MockProver) implements it.
//
// A circuit is used in two passes over the same handle:
//   synthesize: declare cells, gates, lookups, copies (no values)
//   assign:     fill concrete values into the private cells

#pragma once
#include "zkaes/field.h"

#include <cstddef>
#include <string>
#include <vector>

namespace zkaes {

struct Cell {
    size_t index = 0;
};

inline bool operator==(Cell a, Cell b) { return a.index == b.index; }
inline bool operator!=(Cell a, Cell b) { return a.index != b.index; }

using GateId = size_t;
using TableId = size_t;

// coeff * prod(value(slot)). An empty slot list is a constant term.
struct Term {
    Fr coeff;
    std::vector<size_t> slots;
};

// Custom gate template: the sum of its terms must be zero wherever the
// gate is enabled. Slots index the cell list handed to enableGate().
struct Gate {
    std::string name;
    size_t arity = 0;
    std::vector<Term> terms;
};

struct LookupTable {
    std::string name;
    size_t width = 0;
    std::vector<std::vector<Fr>> rows;
};

class ConstraintSystem {
public:
    virtual ~ConstraintSystem() = default;

    virtual Cell privateCell(const std::string& name) = 0;
    // Public cells are numbered in allocation order; that is the instance order.
    virtual Cell publicCell(const std::string& name) = 0;

    virtual GateId addGate(const Gate& gate) = 0;
    virtual TableId addTable(const LookupTable& table) = 0;

    virtual void enableGate(GateId gate, const std::vector<Cell>& cells) = 0;
    virtual void lookup(TableId table, const std::vector<Cell>& cells) = 0;
    virtual void copy(Cell a, Cell b) = 0;

    virtual void assign(Cell cell, const Fr& value) = 0;
};

} // namespace zkaes
