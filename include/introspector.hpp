#pragma once
#include <set>
#include <string>
#include "schema.hpp"
#include "sqlconnection.hpp"

// Reads the live SQLite catalog into a SchemaSnapshot.
// SQLite internal tables and the names in @p excluded are skipped.
class SchemaIntrospector {
public:
    explicit SchemaIntrospector(SQLConnection& conn, std::set<std::string> excluded = {});

    SchemaSnapshot snapshot();
    StrList table_names();
    TableSnapshot table(const std::string& name);

private:
    SQLConnection& conn_;
    std::set<std::string> excluded_;
};
