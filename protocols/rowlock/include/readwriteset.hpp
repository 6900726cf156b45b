#pragma once

#include <unordered_map>

#include "protocols/rowlock/include/value.hpp"
#include "retail/include/record_layout.hpp"

enum ReadWriteType { READ = 0, UPDATE, INSERT };

struct ReadWriteElement {
    ReadWriteElement(const InventoryRow& rec, ReadWriteType rwt, Value* val)
        : rec(rec)
        , rwt(rwt)
        , val(val){};
    InventoryRow rec;  // local copy; installed at precommit when rwt is UPDATE or INSERT
    ReadWriteType rwt = READ;
    Value* val;  // pointer to index, locked by this transaction
};

template <typename Key>
class ReadWriteSet {
public:
    std::unordered_map<Key, ReadWriteElement>& get_table() { return rws; }

private:
    std::unordered_map<Key, ReadWriteElement> rws;
};
