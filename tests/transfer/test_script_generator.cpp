#include "../TestRunner.h"
#include "../fakes/FakeServer.h"
#include "core/migration_errors.h"
#include "transfer/ScriptGenerator.h"

namespace {
int indexOf(const TransferScript &script, const std::string &fragment) {
  for (size_t i = 0; i < script.size(); ++i) {
    if (script[i].text.find(fragment) != std::string::npos)
      return static_cast<int>(i);
  }
  return -1;
}

size_t countContaining(const TransferScript &script,
                       const std::string &fragment) {
  size_t count = 0;
  for (const auto &statement : script) {
    if (statement.text.find(fragment) != std::string::npos)
      count++;
  }
  return count;
}

ObjectDescriptor tableWithKeys() {
  ObjectDescriptor table = makeTable("ops", "Orders");
  IndexDefinition pk;
  pk.name = "PK_Orders";
  pk.typeDesc = "CLUSTERED";
  pk.isPrimaryKey = true;
  pk.isUnique = true;
  pk.keyColumns = {"[id] ASC"};
  table.indexes.push_back(pk);

  IndexDefinition byLabel;
  byLabel.name = "IX_Orders_label";
  byLabel.typeDesc = "NONCLUSTERED";
  byLabel.keyColumns = {"[label] ASC"};
  byLabel.filterDefinition = "([label] IS NOT NULL)";
  table.indexes.push_back(byLabel);

  ConstraintDefinition fk;
  fk.kind = ConstraintDefinition::Kind::FOREIGN_KEY;
  fk.name = "FK_Orders_Customers";
  fk.columns = {"id"};
  fk.referencedSchema = "ops";
  fk.referencedTable = "Customers";
  fk.referencedColumns = {"id"};
  fk.onDelete = "CASCADE";
  fk.onUpdate = "NO_ACTION";
  table.constraints.push_back(fk);

  PermissionEntry select;
  select.scope = PermissionEntry::Scope::OBJECT;
  select.state = "GRANT";
  select.permission = "SELECT";
  select.grantee = "reporting";
  table.permissions.push_back(select);
  return table;
}
} // namespace

int main() {
  TestRunner runner;

  runner.runTest("Empty input gives an empty script", [&]() {
    GenerationResult result = ScriptGenerator::generate({}, TransferPolicy());
    runner.assertCount(0, result.script.size(), "no statements");
    runner.assertCount(0, result.diagnostics.size(), "no diagnostics");
  });

  runner.runTest("Module text is emitted verbatim", [&]() {
    ObjectDescriptor proc = makeProcedure("dbo", "spHealthCheck");
    GenerationResult result =
        ScriptGenerator::generate({proc}, TransferPolicy());
    runner.assertCount(1, result.script.size(), "one statement");
    runner.assertEquals(proc.definition, result.script[0].text,
                        "definition unchanged");
    runner.assertEquals("dbo.spHealthCheck", result.script[0].objectName,
                        "statement attributed to its object");
    runner.assertTrue(result.script[0].stage == ScriptStage::PROGRAMMABILITY,
                      "programmability stage");
  });

  runner.runTest("Excluded categories produce no statements", [&]() {
    std::vector<ObjectDescriptor> objects = {makeProcedure("dbo", "spA"),
                                             makeTable("dbo", "T1")};
    TransferPolicy policy =
        TransferPolicy().withCategory(ObjectCategory::STORED_PROCEDURE, false);
    GenerationResult result = ScriptGenerator::generate(objects, policy);
    runner.assertEquals(-1, indexOf(result.script, "spA"),
                        "procedure left out");
    runner.assertTrue(indexOf(result.script, "CREATE TABLE") >= 0,
                      "table still scripted");
  });

  runner.runTest("Schema is created before the table inside it", [&]() {
    std::vector<ObjectDescriptor> objects = {makeTable("ops", "Audit"),
                                             makeSchema("ops", "dbo")};
    GenerationResult result =
        ScriptGenerator::generate(objects, TransferPolicy());
    int schema = indexOf(result.script, "CREATE SCHEMA [ops]");
    int table = indexOf(result.script, "CREATE TABLE [ops].[Audit]");
    runner.assertTrue(schema >= 0, "schema scripted");
    runner.assertTrue(table >= 0, "table scripted");
    runner.assertTrue(schema < table, "schema first");
    runner.assertEquals("CREATE SCHEMA [ops]", result.script[schema].text,
                        "no inline owner");
    int owner =
        indexOf(result.script, "ALTER AUTHORIZATION ON SCHEMA::[ops] TO [dbo]");
    runner.assertTrue(owner > table, "schema owner kept after the objects");
  });

  runner.runTest("Table body, indexes and foreign keys", [&]() {
    ObjectDescriptor customers = makeTable("ops", "Customers");
    std::vector<ObjectDescriptor> objects = {tableWithKeys(), customers};
    GenerationResult result =
        ScriptGenerator::generate(objects, TransferPolicy());

    int orders = indexOf(result.script, "CREATE TABLE [ops].[Orders]");
    int index = indexOf(result.script, "INDEX [IX_Orders_label]");
    int fk = indexOf(result.script, "FOREIGN KEY");
    int customersAt = indexOf(result.script, "CREATE TABLE [ops].[Customers]");
    runner.assertTrue(orders >= 0 && index >= 0 && fk >= 0 && customersAt >= 0,
                      "all statements present");
    runner.assertContains(result.script[orders].text,
                          "CONSTRAINT [PK_Orders] PRIMARY KEY CLUSTERED ([id] ASC)",
                          "primary key inline");
    runner.assertContains(result.script[orders].text, "[label] nvarchar(100) NULL",
                          "nvarchar length in characters");
    runner.assertContains(result.script[index].text,
                          "WHERE ([label] IS NOT NULL)", "filter kept");
    runner.assertTrue(fk > customersAt, "foreign keys after every table");
    runner.assertContains(result.script[fk].text, "ON DELETE CASCADE",
                          "referential action");
    runner.assertEquals(-1, indexOf(result.script, "ON UPDATE"),
                        "NO ACTION omitted");
  });

  runner.runTest("includeIndexes=false drops only non-key indexes", [&]() {
    TransferPolicy policy =
        TransferPolicy().withFlag(PolicyFlag::INCLUDE_INDEXES, false);
    GenerationResult result =
        ScriptGenerator::generate({tableWithKeys()}, policy);
    runner.assertEquals(-1, indexOf(result.script, "CREATE NONCLUSTERED INDEX"),
                        "index left out");
    runner.assertTrue(indexOf(result.script, "PRIMARY KEY") >= 0,
                      "primary key kept");
  });

  runner.runTest("includePermissions=false drops grants", [&]() {
    GenerationResult with =
        ScriptGenerator::generate({tableWithKeys()}, TransferPolicy());
    runner.assertTrue(indexOf(with.script,
                              "GRANT SELECT ON OBJECT::[ops].[Orders] TO "
                              "[reporting]") >= 0,
                      "grant scripted by default");
    runner.assertTrue(with.script.back().stage == ScriptStage::PERMISSIONS,
                      "grants come last");

    TransferPolicy policy =
        TransferPolicy().withFlag(PolicyFlag::INCLUDE_PERMISSIONS, false);
    GenerationResult without =
        ScriptGenerator::generate({tableWithKeys()}, policy);
    runner.assertEquals(-1, indexOf(without.script, "GRANT"), "no grants");
  });

  runner.runTest("preserveOwnerSchema=false uses unqualified names", [&]() {
    ObjectDescriptor table = makeTable("ops", "Audit");
    table.owner = "auditor";
    TransferPolicy policy =
        TransferPolicy().withFlag(PolicyFlag::PRESERVE_OWNER_SCHEMA, false);
    GenerationResult result =
        ScriptGenerator::generate({table, makeSchema("ops", "auditor")}, policy);
    runner.assertTrue(indexOf(result.script, "CREATE TABLE [Audit]") >= 0,
                      "bare table name");
    runner.assertEquals(-1, indexOf(result.script, "AUTHORIZATION"),
                        "no owner clauses");

    GenerationResult preserved =
        ScriptGenerator::generate({table}, TransferPolicy());
    runner.assertTrue(indexOf(preserved.script,
                              "ALTER AUTHORIZATION ON OBJECT::[ops].[Audit] TO "
                              "[auditor]") >= 0,
                      "explicit owner restored");
  });

  runner.runTest("Unscriptable object is skipped with a diagnostic", [&]() {
    ObjectDescriptor encrypted =
        makeObject(ObjectCategory::VIEW, "dbo", "vSecret", "");
    std::vector<ObjectDescriptor> objects = {encrypted,
                                             makeProcedure("dbo", "spOk")};
    GenerationResult result =
        ScriptGenerator::generate(objects, TransferPolicy());
    runner.assertCount(1, result.script.size(), "other object scripted");
    runner.assertCount(1, result.diagnostics.size(), "one diagnostic");
    runner.assertEquals("dbo.vSecret", result.diagnostics[0].objectName,
                        "diagnostic names the object");
    runner.assertCount(1, result.scriptedObjects, "one object scripted");
  });

  runner.runTest("Unscriptable object aborts when the policy says so", [&]() {
    ObjectDescriptor encrypted =
        makeObject(ObjectCategory::VIEW, "dbo", "vSecret", "");
    TransferPolicy policy = TransferPolicy().withFlag(
        PolicyFlag::CONTINUE_ON_GENERATION_ERROR, false);
    bool threw = false;
    try {
      ScriptGenerator::generate({makeProcedure("dbo", "spOk"), encrypted},
                                policy);
    } catch (const GenerationError &e) {
      threw = true;
      runner.assertEquals("dbo.vSecret", e.objectName(), "object named");
    }
    runner.assertTrue(threw, "GenerationError raised");
  });

  runner.runTest("A failing object leaves no partial statements", [&]() {
    ObjectDescriptor table = makeTable("dbo", "Broken");
    ConstraintDefinition fk;
    fk.kind = ConstraintDefinition::Kind::FOREIGN_KEY;
    fk.name = "FK_Broken";
    fk.columns = {"id", "label"};
    fk.referencedSchema = "dbo";
    fk.referencedTable = "Other";
    fk.referencedColumns = {"id"};
    table.constraints.push_back(fk);

    GenerationResult result =
        ScriptGenerator::generate({table}, TransferPolicy());
    runner.assertCount(0, result.script.size(),
                       "CREATE TABLE withdrawn with the bad key");
    runner.assertCount(1, result.diagnostics.size(), "diagnostic recorded");
  });

  runner.runTest("Principals: roles, users, memberships, grants", [&]() {
    ObjectDescriptor user = makeUser("app", "app_login");
    user.attributes["default_schema"] = "dbo";
    PermissionEntry connect;
    connect.scope = PermissionEntry::Scope::DATABASE;
    connect.state = "GRANT";
    connect.permission = "VIEW DEFINITION";
    connect.grantee = "app";
    user.permissions.push_back(connect);

    std::vector<ObjectDescriptor> objects = {
        user, makeRole("ops_readers", {"app"}), makeProcedure("dbo", "spA")};
    GenerationResult result =
        ScriptGenerator::generate(objects, TransferPolicy());

    int proc = indexOf(result.script, "CREATE PROCEDURE");
    int role = indexOf(result.script, "CREATE ROLE [ops_readers]");
    int createUser = indexOf(
        result.script,
        "CREATE USER [app] FOR LOGIN [app_login] WITH DEFAULT_SCHEMA = [dbo]");
    int member =
        indexOf(result.script, "ALTER ROLE [ops_readers] ADD MEMBER [app]");
    int grant = indexOf(result.script, "GRANT VIEW DEFINITION TO [app]");
    runner.assertTrue(proc >= 0 && role >= 0 && createUser >= 0 &&
                          member >= 0 && grant >= 0,
                      "all statements present");
    runner.assertTrue(proc < role, "programmability before principals");
    runner.assertTrue(role < createUser, "roles before users");
    runner.assertTrue(createUser < member, "users before memberships");
    runner.assertTrue(member < grant, "memberships before grants");
  });

  runner.runTest("includeRoleMemberships=false drops ADD MEMBER", [&]() {
    TransferPolicy policy =
        TransferPolicy().withFlag(PolicyFlag::INCLUDE_ROLE_MEMBERSHIPS, false);
    GenerationResult result = ScriptGenerator::generate(
        {makeRole("ops_readers", {"app", "svc"})}, policy);
    runner.assertCount(1, result.script.size(), "role only");
    runner.assertCount(0, countContaining(result.script, "ADD MEMBER"),
                       "no memberships");
  });

  runner.runTest("Contained users are reported, not scripted", [&]() {
    ObjectDescriptor contained = makeUser("partner", "");
    contained.attributes["authentication"] = "DATABASE";
    GenerationResult result =
        ScriptGenerator::generate({contained}, TransferPolicy());
    runner.assertCount(0, result.script.size(), "no CREATE USER");
    runner.assertCount(1, result.diagnostics.size(), "diagnostic recorded");
  });

  runner.runTest("Dependency objects need includeDependencies", [&]() {
    ObjectDescriptor table = makeTable("dbo", "Metrics");
    table.isDependency = true;
    TransferPolicy noTables =
        TransferPolicy().withCategory(ObjectCategory::TABLE, false);

    GenerationResult skipped = ScriptGenerator::generate({table}, noTables);
    runner.assertCount(0, skipped.script.size(), "dependency skipped");

    GenerationResult included = ScriptGenerator::generate(
        {table}, noTables.withFlag(PolicyFlag::INCLUDE_DEPENDENCIES, true));
    runner.assertCount(1, included.script.size(), "dependency scripted");
  });

  runner.runTest("Disabled trigger is created then disabled", [&]() {
    ObjectDescriptor trigger =
        makeObject(ObjectCategory::TRIGGER, "dbo", "trgAudit",
                   "CREATE TRIGGER dbo.trgAudit ON dbo.Audit AFTER INSERT AS "
                   "SET NOCOUNT ON");
    trigger.parentSchema = "dbo";
    trigger.parentName = "Audit";
    trigger.isDisabled = true;
    GenerationResult result =
        ScriptGenerator::generate({trigger}, TransferPolicy());
    runner.assertCount(2, result.script.size(), "create and disable");
    runner.assertEquals("DISABLE TRIGGER [dbo].[trgAudit] ON [dbo].[Audit]",
                        result.script[1].text, "disable statement");
  });

  runner.runTest("Sequences, synonyms and alias types", [&]() {
    ObjectDescriptor sequence =
        makeObject(ObjectCategory::SEQUENCE, "dbo", "TicketNo");
    sequence.attributes["type"] = "int";
    sequence.attributes["start_value"] = "1000";
    sequence.attributes["increment"] = "1";
    sequence.attributes["is_cached"] = "0";

    ObjectDescriptor synonym = makeObject(ObjectCategory::SYNONYM, "dbo",
                                          "RemoteJobs",
                                          "[msdb].[dbo].[sysjobs]");

    ObjectDescriptor alias =
        makeObject(ObjectCategory::USER_DEFINED_DATA_TYPE, "dbo", "Phone");
    ColumnDefinition base;
    base.typeName = "varchar";
    base.maxLength = 20;
    base.isNullable = false;
    alias.columns.push_back(base);

    GenerationResult result = ScriptGenerator::generate(
        {synonym, sequence, alias}, TransferPolicy());
    runner.assertCount(3, result.script.size(), "three statements");
    runner.assertEquals("CREATE TYPE [dbo].[Phone] FROM varchar(20) NOT NULL",
                        result.script[0].text, "alias type first");
    runner.assertEquals("CREATE SEQUENCE [dbo].[TicketNo] AS int START WITH "
                        "1000 INCREMENT BY 1 NO CYCLE NO CACHE",
                        result.script[1].text, "sequence second");
    runner.assertEquals(
        "CREATE SYNONYM [dbo].[RemoteJobs] FOR [msdb].[dbo].[sysjobs]",
        result.script[2].text, "synonym last");
  });

  runner.runTest("Table types carry no constraint names", [&]() {
    ObjectDescriptor type =
        makeObject(ObjectCategory::USER_DEFINED_TABLE_TYPE, "dbo", "IdList");
    ColumnDefinition id;
    id.name = "id";
    id.typeName = "int";
    id.isNullable = false;
    type.columns.push_back(id);
    ColumnDefinition label;
    label.name = "label";
    label.typeName = "nvarchar";
    label.maxLength = 200;
    label.defaultConstraintName = "DF__TT_IdList__label__1A2B";
    label.defaultDefinition = "(N'x')";
    type.columns.push_back(label);
    IndexDefinition pk;
    pk.name = "PK__TT_IdList__3213E83F";
    pk.typeDesc = "CLUSTERED";
    pk.isPrimaryKey = true;
    pk.keyColumns = {"[id] ASC"};
    type.indexes.push_back(pk);
    ConstraintDefinition check;
    check.name = "CK__TT_IdList__id__2B3C";
    check.definition = "([id]>(0))";
    type.constraints.push_back(check);

    GenerationResult result =
        ScriptGenerator::generate({type}, TransferPolicy());
    runner.assertCount(1, result.script.size(), "one statement");
    runner.assertEquals("CREATE TYPE [dbo].[IdList] AS TABLE (\n"
                        "    [id] int NOT NULL,\n"
                        "    [label] nvarchar(100) NULL DEFAULT (N'x'),\n"
                        "    PRIMARY KEY CLUSTERED ([id] ASC),\n"
                        "    CHECK ([id]>(0))\n"
                        ")",
                        result.script[0].text, "unnamed constraints");
    runner.assertTrue(result.script[0].stage == ScriptStage::TYPES,
                      "types stage");

    ObjectDescriptor table = makeTable("dbo", "Labels");
    table.columns[1].defaultConstraintName = "DF_Labels_label";
    table.columns[1].defaultDefinition = "(N'x')";
    GenerationResult tableResult =
        ScriptGenerator::generate({table}, TransferPolicy());
    runner.assertContains(tableResult.script[0].text,
                          "CONSTRAINT [DF_Labels_label] DEFAULT (N'x')",
                          "tables keep their constraint names");
  });

  runner.runTest("CLR types, aggregates and assemblies", [&]() {
    ObjectDescriptor assembly =
        makeObject(ObjectCategory::ASSEMBLY, "", "Geo", "0x4D5A9000");
    assembly.attributes["permission_set"] = "safe";
    assembly.owner = "dbo";

    ObjectDescriptor clrType =
        makeObject(ObjectCategory::USER_DEFINED_TYPE, "dbo", "Point");
    clrType.attributes["assembly"] = "Geo";
    clrType.attributes["class"] = "Geo.Point";

    ObjectDescriptor aggregate =
        makeObject(ObjectCategory::USER_DEFINED_AGGREGATE, "dbo", "Concat");
    aggregate.attributes["assembly"] = "Geo";
    aggregate.attributes["class"] = "Geo.Concat";
    aggregate.attributes["parameters"] = "@value nvarchar(4000)";
    aggregate.attributes["returns"] = "nvarchar(max)";

    GenerationResult result = ScriptGenerator::generate(
        {aggregate, clrType, assembly}, TransferPolicy());
    runner.assertCount(0, result.diagnostics.size(), "all scriptable");
    runner.assertEquals("CREATE TYPE [dbo].[Point] EXTERNAL NAME "
                        "[Geo].[Geo.Point]",
                        result.script[0].text, "CLR type");
    runner.assertEquals("CREATE AGGREGATE [dbo].[Concat](@value "
                        "nvarchar(4000)) RETURNS nvarchar(max) EXTERNAL NAME "
                        "[Geo].[Geo.Concat]",
                        result.script[1].text, "aggregate");
    runner.assertEquals("CREATE ASSEMBLY [Geo] FROM 0x4D5A9000 WITH "
                        "PERMISSION_SET = SAFE",
                        result.script[2].text, "assembly");
    runner.assertEquals("ALTER AUTHORIZATION ON ASSEMBLY::[Geo] TO [dbo]",
                        result.script[3].text, "assembly owner");

    ObjectDescriptor noBinary =
        makeObject(ObjectCategory::ASSEMBLY, "", "Lost", "");
    ObjectDescriptor noClass =
        makeObject(ObjectCategory::USER_DEFINED_TYPE, "dbo", "Orphan");
    noClass.attributes["assembly"] = "Geo";
    GenerationResult failed =
        ScriptGenerator::generate({noBinary, noClass}, TransferPolicy());
    runner.assertCount(0, failed.script.size(), "nothing scripted");
    runner.assertCount(2, failed.diagnostics.size(), "both reported");
  });

  runner.runTest("CLR procedures and functions use EXTERNAL NAME", [&]() {
    ObjectDescriptor proc =
        makeObject(ObjectCategory::STORED_PROCEDURE, "dbo", "spNotify");
    proc.attributes["external_name"] = "[Geo].[Geo.Jobs].[Notify]";
    proc.attributes["parameters"] = "@job int, @sent bit OUTPUT";

    ObjectDescriptor function =
        makeObject(ObjectCategory::USER_DEFINED_FUNCTION, "dbo", "fnDistance");
    function.attributes["external_name"] = "[Geo].[Geo.Math].[Distance]";
    function.attributes["parameters"] = "@a [dbo].[Point], @b [dbo].[Point]";
    function.attributes["returns"] = "float";

    ObjectDescriptor noReturn =
        makeObject(ObjectCategory::USER_DEFINED_FUNCTION, "dbo", "fnBroken");
    noReturn.attributes["external_name"] = "[Geo].[Geo.Math].[Broken]";

    GenerationResult result = ScriptGenerator::generate(
        {proc, function, noReturn}, TransferPolicy());
    runner.assertTrue(indexOf(result.script,
                              "CREATE PROCEDURE [dbo].[spNotify] @job int, "
                              "@sent bit OUTPUT AS EXTERNAL NAME "
                              "[Geo].[Geo.Jobs].[Notify]") >= 0,
                      "CLR procedure");
    runner.assertTrue(indexOf(result.script,
                              "CREATE FUNCTION [dbo].[fnDistance](@a "
                              "[dbo].[Point], @b [dbo].[Point]) RETURNS float "
                              "AS EXTERNAL NAME [Geo].[Geo.Math].[Distance]") >=
                          0,
                      "CLR function");
    runner.assertCount(1, result.diagnostics.size(), "missing return type");
    runner.assertEquals("dbo.fnBroken", result.diagnostics[0].objectName,
                        "function without return type reported");
  });

  runner.runTest("Owners are transferred after principals exist", [&]() {
    ObjectDescriptor owner = makeUser("ops_owner", "ops_login");
    ObjectDescriptor role = makeRole("ops_readers", {"ops_owner"});
    role.owner = "ops_owner";
    ObjectDescriptor table = makeTable("ops", "Audit");
    table.owner = "ops_owner";
    ObjectDescriptor type =
        makeObject(ObjectCategory::USER_DEFINED_DATA_TYPE, "ops", "Code");
    ColumnDefinition base;
    base.typeName = "char";
    base.maxLength = 4;
    type.columns.push_back(base);
    type.owner = "ops_owner";
    PermissionEntry select;
    select.scope = PermissionEntry::Scope::OBJECT;
    select.state = "GRANT";
    select.permission = "SELECT";
    select.grantee = "ops_readers";
    table.permissions.push_back(select);

    GenerationResult result = ScriptGenerator::generate(
        {table, makeSchema("ops", "ops_owner"), owner, role, type},
        TransferPolicy());
    runner.assertEquals(-1, indexOf(result.script, " AUTHORIZATION ["),
                        "no inline AUTHORIZATION clause");

    int createUser = indexOf(result.script, "CREATE USER [ops_owner]");
    int member =
        indexOf(result.script, "ALTER ROLE [ops_readers] ADD MEMBER [ops_owner]");
    int schemaOwner = indexOf(
        result.script, "ALTER AUTHORIZATION ON SCHEMA::[ops] TO [ops_owner]");
    int roleOwner = indexOf(
        result.script, "ALTER AUTHORIZATION ON ROLE::[ops_readers] TO "
                       "[ops_owner]");
    int tableOwner = indexOf(
        result.script, "ALTER AUTHORIZATION ON OBJECT::[ops].[Audit] TO "
                       "[ops_owner]");
    int typeOwner = indexOf(
        result.script, "ALTER AUTHORIZATION ON TYPE::[ops].[Code] TO "
                       "[ops_owner]");
    int grant = indexOf(result.script, "GRANT SELECT ON OBJECT::[ops].[Audit]");
    runner.assertTrue(createUser >= 0 && member >= 0 && schemaOwner >= 0 &&
                          roleOwner >= 0 && tableOwner >= 0 && typeOwner >= 0 &&
                          grant >= 0,
                      "all statements present");
    runner.assertTrue(createUser < schemaOwner && createUser < roleOwner &&
                          createUser < tableOwner && createUser < typeOwner,
                      "owner exists before transfers");
    runner.assertTrue(member < schemaOwner, "memberships before transfers");
    runner.assertTrue(tableOwner < grant, "transfers before permissions");
    runner.assertTrue(result.script[tableOwner].stage == ScriptStage::PRINCIPALS,
                      "transfers in the principals stage");
  });

  runner.runTest("Grants-only objects script memberships and grants", [&]() {
    ObjectDescriptor datareader = makeRole("db_datareader", {"appUser"});
    datareader.isSystemObject = true;
    datareader.isGrantsOnly = true;
    datareader.owner = "dbo";

    ObjectDescriptor sendMail = makeProcedure("dbo", "sp_send_dbmail");
    sendMail.isSystemObject = true;
    sendMail.isGrantsOnly = true;
    sendMail.owner = "dbo";
    PermissionEntry execute;
    execute.scope = PermissionEntry::Scope::OBJECT;
    execute.state = "GRANT";
    execute.permission = "EXECUTE";
    execute.grantee = "appUser";
    sendMail.permissions.push_back(execute);

    ObjectDescriptor dboSchema = makeSchema("dbo", "dbo");
    dboSchema.isSystemObject = true;
    dboSchema.isGrantsOnly = true;
    PermissionEntry select;
    select.scope = PermissionEntry::Scope::SCHEMA;
    select.state = "GRANT";
    select.permission = "SELECT";
    select.grantee = "appUser";
    dboSchema.permissions.push_back(select);

    GenerationResult result = ScriptGenerator::generate(
        {makeUser("appUser", "appLogin"), datareader, sendMail, dboSchema},
        TransferPolicy());
    runner.assertCount(4, result.script.size(), "four statements");
    runner.assertEquals("CREATE USER [appUser] FOR LOGIN [appLogin]",
                        result.script[0].text, "user first");
    runner.assertEquals("ALTER ROLE [db_datareader] ADD MEMBER [appUser]",
                        result.script[1].text, "membership emitted");
    runner.assertTrue(indexOf(result.script,
                              "GRANT EXECUTE ON OBJECT::[dbo].[sp_send_dbmail] "
                              "TO [appUser]") >= 0,
                      "grant on the built-in procedure");
    runner.assertTrue(indexOf(result.script,
                              "GRANT SELECT ON SCHEMA::[dbo] TO [appUser]") >= 0,
                      "grant on the dbo schema");
    runner.assertEquals(-1, indexOf(result.script, "CREATE ROLE"),
                        "built-in role not created");
    runner.assertEquals(-1, indexOf(result.script, "ALTER AUTHORIZATION"),
                        "built-in owners untouched");
  });

  runner.runTest("formatDataType", [&]() {
    ColumnDefinition column;
    column.typeName = "nvarchar";
    column.maxLength = -1;
    runner.assertEquals("nvarchar(max)",
                        ScriptGenerator::formatDataType(column), "max length");

    column.typeName = "decimal";
    column.precision = 10;
    column.scale = 2;
    runner.assertEquals("decimal(10,2)",
                        ScriptGenerator::formatDataType(column), "decimal");

    column.typeName = "int";
    runner.assertEquals("int", ScriptGenerator::formatDataType(column),
                        "fixed size type");

    column.typeName = "Phone";
    column.typeSchema = "dbo";
    column.isUserDefinedType = true;
    runner.assertEquals("[dbo].[Phone]",
                        ScriptGenerator::formatDataType(column),
                        "user-defined type quoted");
  });

  runner.printSummary();
  return 0;
}
