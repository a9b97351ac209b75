// sbox_table.h
//
// Fixed (input, output) lookup tables for the AES S-box. SubBytes is
// expressed only through lookups into this table: the S-box has no
// low-degree form over Fr.
#pragma once
#include "zkaes/constraint_system.h"

#include <string>

namespace zkaes {

// 256 rows, width 2, input column ascending 0..255.
LookupTable buildSboxTable();
LookupTable buildInverseSboxTable();

class SboxChip {
public:
    // Registers the table. Once per constraint system.
    void load(ConstraintSystem& cs);
    bool loaded() const { return loaded_; }

    // Allocates the output cell and binds (input, output) to a table row.
    // The output is a byte by construction; the input must be too for the
    // lookup to be satisfiable.
    Cell lookup(ConstraintSystem& cs, Cell input, const std::string& name) const;

private:
    TableId table_ = 0;
    bool loaded_ = false;
};

} // namespace zkaes
