// mock_prover.cpp
#include "zkaes/mock_prover.h"
#include "zkaes/errors.h"
#include "zkaes/log.h"

#include <sstream>

namespace zkaes {

static const char* kind_name(VerifyFailure::Kind k){
    switch(k){
        case VerifyFailure::Kind::Gate: return "gate";
        case VerifyFailure::Kind::Lookup: return "lookup";
        case VerifyFailure::Kind::Copy: return "copy";
        case VerifyFailure::Kind::Unassigned: return "unassigned";
    }
    return "?";
}

std::string VerifyFailure::describe() const {
    std::ostringstream o;
    o<<kind_name(kind)<<" '"<<name<<"' #"<<index<<" cells=[";
    for(size_t i=0;i<cells.size();i++) o<<(i?",":"")<<cells[i].index;
    o<<"]";
    return o.str();
}

static std::string unsatisfied_message(const std::vector<VerifyFailure>& f){
    std::string m = "constraint not satisfied: " + std::to_string(f.size()) + " failure(s)";
    if(!f.empty()) m += ", first: " + f.front().describe();
    return m;
}

UnsatisfiedError::UnsatisfiedError(std::vector<VerifyFailure> failures)
    : std::runtime_error(unsatisfied_message(failures)), failures_(std::move(failures)) {}

MockProver::MockProver(){ initField(); }

Cell MockProver::privateCell(const std::string& name){
    Cell c{cells_.size()};
    cells_.push_back({name, false, 0});
    values_.emplace_back();
    return c;
}

Cell MockProver::publicCell(const std::string& name){
    Cell c{cells_.size()};
    cells_.push_back({name, true, public_.size()});
    values_.emplace_back();
    public_.push_back(c);
    return c;
}

GateId MockProver::addGate(const Gate& gate){
    for(const auto& t : gate.terms){
        for(size_t s : t.slots){
            if(s >= gate.arity)
                throw SynthesisError("gate '" + gate.name + "': slot " + std::to_string(s) +
                                     " out of range for arity " + std::to_string(gate.arity));
        }
    }
    gates_.push_back(gate);
    return gates_.size()-1;
}

TableId MockProver::addTable(const LookupTable& table){
    std::unordered_set<std::string> keys;
    for(const auto& row : table.rows){
        if(row.size() != table.width)
            throw SynthesisError("table '" + table.name + "': row width mismatch");
        std::vector<const Fr*> r;
        for(const auto& v : row) r.push_back(&v);
        keys.insert(rowKey(r));
    }
    tables_.push_back(table);
    tableKeys_.push_back(std::move(keys));
    return tables_.size()-1;
}

void MockProver::enableGate(GateId gate, const std::vector<Cell>& cells){
    if(gate >= gates_.size()) throw SynthesisError("unknown gate id " + std::to_string(gate));
    const Gate& g = gates_[gate];
    if(cells.size() != g.arity)
        throw SynthesisError("gate '" + g.name + "' expects " + std::to_string(g.arity) +
                             " cells, got " + std::to_string(cells.size()));
    for(Cell c : cells) checkCell(c, g.name.c_str());
    gateInstances_.push_back({gate, cells});
}

void MockProver::lookup(TableId table, const std::vector<Cell>& cells){
    if(table >= tables_.size()) throw SynthesisError("unknown table id " + std::to_string(table));
    const LookupTable& t = tables_[table];
    if(cells.size() != t.width)
        throw SynthesisError("lookup into '" + t.name + "' expects " + std::to_string(t.width) +
                             " cells, got " + std::to_string(cells.size()));
    for(Cell c : cells) checkCell(c, t.name.c_str());
    lookups_.push_back({table, cells});
}

void MockProver::copy(Cell a, Cell b){
    checkCell(a, "copy");
    checkCell(b, "copy");
    copies_.emplace_back(a, b);
}

void MockProver::assign(Cell cell, const Fr& value){
    checkCell(cell, "assign");
    if(cells_[cell.index].isPublic)
        throw SynthesisError("cannot assign public cell '" + cells_[cell.index].name + "'");
    values_[cell.index] = value;
}

void MockProver::checkCell(Cell cell, const char* what) const {
    if(cell.index >= cells_.size())
        throw SynthesisError(std::string(what) + ": unknown cell " + std::to_string(cell.index));
}

const Fr* MockProver::resolve(Cell cell, const std::vector<Fr>& instance) const {
    const CellInfo& info = cells_[cell.index];
    if(info.isPublic) return &instance[info.publicIndex];
    const auto& v = values_[cell.index];
    return v ? &*v : nullptr;
}

std::string MockProver::rowKey(const std::vector<const Fr*>& row) const {
    std::string k;
    for(const Fr* v : row){ k += v->getStr(16); k.push_back('|'); }
    return k;
}

std::vector<VerifyFailure> MockProver::verify(const std::vector<Fr>& instance) const {
    if(instance.size() != public_.size())
        throw InputError("expected " + std::to_string(public_.size()) + " public inputs, got " +
                         std::to_string(instance.size()));

    std::vector<VerifyFailure> failures;

    for(size_t i=0;i<cells_.size();i++){
        if(!cells_[i].isPublic && !values_[i]){
            failures.push_back({VerifyFailure::Kind::Unassigned, cells_[i].name, i, {Cell{i}}});
        }
    }

    std::vector<const Fr*> vals;
    for(size_t i=0;i<gateInstances_.size();i++){
        const auto& inst = gateInstances_[i];
        const Gate& g = gates_[inst.gate];
        vals.clear();
        bool complete = true;
        for(Cell c : inst.cells){
            const Fr* v = resolve(c, instance);
            if(!v){ complete = false; break; }
            vals.push_back(v);
        }
        if(!complete) continue;

        Fr acc = frFromU64(0);
        for(const auto& t : g.terms){
            Fr m = t.coeff;
            for(size_t s : t.slots) m *= *vals[s];
            acc += m;
        }
        if(!acc.isZero()) failures.push_back({VerifyFailure::Kind::Gate, g.name, i, inst.cells});
    }

    for(size_t i=0;i<lookups_.size();i++){
        const auto& inst = lookups_[i];
        vals.clear();
        bool complete = true;
        for(Cell c : inst.cells){
            const Fr* v = resolve(c, instance);
            if(!v){ complete = false; break; }
            vals.push_back(v);
        }
        if(!complete) continue;
        if(!tableKeys_[inst.table].count(rowKey(vals)))
            failures.push_back({VerifyFailure::Kind::Lookup, tables_[inst.table].name, i, inst.cells});
    }

    for(size_t i=0;i<copies_.size();i++){
        const Fr* a = resolve(copies_[i].first, instance);
        const Fr* b = resolve(copies_[i].second, instance);
        if(!a || !b) continue;
        if(!(*a == *b)){
            failures.push_back({VerifyFailure::Kind::Copy, cells_[copies_[i].first.index].name, i,
                                {copies_[i].first, copies_[i].second}});
        }
    }

    if(!failures.empty()) dbg("mock prover: " + std::to_string(failures.size()) + " failure(s)");
    return failures;
}

void MockProver::assertSatisfied(const std::vector<Fr>& instance) const {
    auto failures = verify(instance);
    if(!failures.empty()) throw UnsatisfiedError(std::move(failures));
}

std::optional<Fr> MockProver::value(Cell cell) const {
    checkCell(cell, "value");
    return values_[cell.index];
}

const std::string& MockProver::cellName(Cell cell) const {
    checkCell(cell, "cellName");
    return cells_[cell.index].name;
}

CircuitStats MockProver::stats() const {
    CircuitStats s;
    s.publicCells = public_.size();
    s.privateCells = cells_.size() - public_.size();
    s.gateDefinitions = gates_.size();
    s.gateInstances = gateInstances_.size();
    s.tables = tables_.size();
    for(const auto& t : tables_) s.tableRows += t.rows.size();
    s.lookups = lookups_.size();
    s.copies = copies_.size();
    for(const auto& inst : gateInstances_) s.gateUsage[gates_[inst.gate].name]++;
    return s;
}

} // namespace zkaes
