#pragma once
#include "schemadiff.hpp"
#include <sstream>

class DDLVisitor {
public:
    virtual ~DDLVisitor() = default;

    // SQL for one operation; @p working is the schema right before it runs
    virtual StrList visit(const DiffOp& op, const SchemaSnapshot& working) = 0;
    // CREATE TABLE followed by its CREATE INDEX statements
    virtual StrList create_table(const TableSnapshot& table) = 0;
    virtual std::string sql_type(const ColumnDefinition& c) = 0;
    virtual std::string sql_default(const ColumnDefinition& c);
    virtual std::string column_def(const ColumnDefinition& c);
    virtual std::string create_index(const std::string& table, const IndexDefinition& idx);
};

class SqliteDDLVisitor : public DDLVisitor {
public:
    StrList visit(const DiffOp& op, const SchemaSnapshot& working) override;
    StrList create_table(const TableSnapshot& table) override;
    std::string sql_type(const ColumnDefinition& c) override;

    // create-copy-drop-rename, for changes ALTER TABLE cannot express
    StrList rebuild(const TableSnapshot& current, const TableSnapshot& target);

private:
    std::string create_table_stmt(const TableSnapshot& table, const std::string& name);
    bool add_needs_rebuild(const ColumnDefinition& c) const;
    bool drop_needs_rebuild(const TableSnapshot& t, const ColumnDefinition& c) const;
};
