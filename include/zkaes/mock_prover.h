// mock_prover.h
//
// In-memory ConstraintSystem that records a circuit and checks a witness
// against it, cell by cell. No proof is produced; this is the
// satisfiability oracle used by tests and the CLI.

#pragma once
#include "zkaes/constraint_system.h"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace zkaes {

struct VerifyFailure {
    enum class Kind { Gate, Lookup, Copy, Unassigned };

    Kind kind = Kind::Gate;
    std::string name;        // gate / table name, or the cell name
    size_t index = 0;        // instance number of that gate / lookup / copy
    std::vector<Cell> cells;

    std::string describe() const;
};

class UnsatisfiedError : public std::runtime_error {
public:
    explicit UnsatisfiedError(std::vector<VerifyFailure> failures);
    const std::vector<VerifyFailure>& failures() const { return failures_; }

private:
    std::vector<VerifyFailure> failures_;
};

struct CircuitStats {
    size_t privateCells = 0;
    size_t publicCells = 0;
    size_t gateDefinitions = 0;
    size_t gateInstances = 0;
    size_t tables = 0;
    size_t tableRows = 0;
    size_t lookups = 0;
    size_t copies = 0;
    std::map<std::string, size_t> gateUsage;
};

class MockProver : public ConstraintSystem {
public:
    MockProver();

    Cell privateCell(const std::string& name) override;
    Cell publicCell(const std::string& name) override;
    GateId addGate(const Gate& gate) override;
    TableId addTable(const LookupTable& table) override;
    void enableGate(GateId gate, const std::vector<Cell>& cells) override;
    void lookup(TableId table, const std::vector<Cell>& cells) override;
    void copy(Cell a, Cell b) override;
    void assign(Cell cell, const Fr& value) override;

    // instance[i] is the value of the i-th public cell.
    std::vector<VerifyFailure> verify(const std::vector<Fr>& instance) const;
    void assertSatisfied(const std::vector<Fr>& instance) const;

    std::optional<Fr> value(Cell cell) const;
    const std::string& cellName(Cell cell) const;
    size_t numCells() const { return cells_.size(); }
    const std::vector<Cell>& publicCells() const { return public_; }

    CircuitStats stats() const;

private:
    struct CellInfo {
        std::string name;
        bool isPublic = false;
        size_t publicIndex = 0;
    };
    struct GateInstance {
        GateId gate;
        std::vector<Cell> cells;
    };
    struct LookupInstance {
        TableId table;
        std::vector<Cell> cells;
    };

    void checkCell(Cell cell, const char* what) const;
    const Fr* resolve(Cell cell, const std::vector<Fr>& instance) const;
    std::string rowKey(const std::vector<const Fr*>& row) const;

    std::vector<CellInfo> cells_;
    std::vector<std::optional<Fr>> values_;
    std::vector<Cell> public_;

    std::vector<Gate> gates_;
    std::vector<GateInstance> gateInstances_;

    std::vector<LookupTable> tables_;
    std::vector<std::unordered_set<std::string>> tableKeys_;
    std::vector<LookupInstance> lookups_;

    std::vector<std::pair<Cell, Cell>> copies_;
};

} // namespace zkaes
