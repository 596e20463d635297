#include "../TestRunner.h"
#include "../fakes/FakeServer.h"
#include "transfer/ObjectEnumerator.h"
#include "transfer/ScriptGenerator.h"
#include <algorithm>

namespace {
bool containsObject(const std::vector<ObjectDescriptor> &objects,
                    const std::string &qualifiedName) {
  return std::any_of(objects.begin(), objects.end(),
                     [&](const ObjectDescriptor &object) {
                       return object.qualifiedName() == qualifiedName;
                     });
}

const ObjectDescriptor *findObject(const std::vector<ObjectDescriptor> &objects,
                                   const std::string &qualifiedName) {
  for (const auto &object : objects) {
    if (object.qualifiedName() == qualifiedName)
      return &object;
  }
  return nullptr;
}
} // namespace

int main() {
  TestRunner runner;

  runner.runTest("Empty database yields an empty sequence", [&]() {
    FakeServer source("src");
    auto objects = ObjectEnumerator::enumerate(source, SystemDatabase::MODEL,
                                               TransferPolicy());
    runner.assertCount(0, objects.size(), "no objects");
  });

  runner.runTest("System objects are skipped by default", [&]() {
    FakeServer source("src");
    ObjectDescriptor builtIn = makeProcedure("dbo", "sp_MSforeachdb");
    builtIn.isSystemObject = true;
    source.fakeCatalog().add(SystemDatabase::MASTER, builtIn);
    source.fakeCatalog().add(SystemDatabase::MASTER,
                             makeProcedure("dbo", "spHealthCheck"));

    auto objects = ObjectEnumerator::enumerate(source, SystemDatabase::MASTER,
                                               TransferPolicy());
    runner.assertCount(1, objects.size(), "only the user object");
    runner.assertTrue(containsObject(objects, "dbo.spHealthCheck"),
                      "user procedure selected");
  });

  runner.runTest("includeSystemObjects keeps built-in objects", [&]() {
    FakeServer source("src");
    ObjectDescriptor builtIn = makeProcedure("dbo", "sp_MSforeachdb");
    builtIn.isSystemObject = true;
    source.fakeCatalog().add(SystemDatabase::MASTER, builtIn);

    TransferPolicy policy =
        TransferPolicy().withFlag(PolicyFlag::INCLUDE_SYSTEM_OBJECTS, true);
    auto objects =
        ObjectEnumerator::enumerate(source, SystemDatabase::MASTER, policy);
    runner.assertCount(1, objects.size(), "built-in object kept");
  });

  runner.runTest("Built-in role keeps memberships of migrated users", [&]() {
    FakeServer source("src");
    auto &catalog = source.fakeCatalog();
    catalog.add(SystemDatabase::MSDB, makeUser("appUser", "appLogin"));
    ObjectDescriptor dbo = makeUser("dbo", "sa");
    dbo.isSystemObject = true;
    catalog.add(SystemDatabase::MSDB, dbo);
    ObjectDescriptor datareader = makeRole("db_datareader", {"appUser", "dbo"});
    datareader.isSystemObject = true;
    catalog.add(SystemDatabase::MSDB, datareader);
    ObjectDescriptor dbowner = makeRole("db_owner", {"dbo"});
    dbowner.isSystemObject = true;
    catalog.add(SystemDatabase::MSDB, dbowner);

    ObjectDescriptor sendMail = makeProcedure("dbo", "sp_send_dbmail");
    sendMail.isSystemObject = true;
    PermissionEntry execute;
    execute.scope = PermissionEntry::Scope::OBJECT;
    execute.state = "GRANT";
    execute.permission = "EXECUTE";
    execute.grantee = "appUser";
    sendMail.permissions.push_back(execute);
    execute.grantee = "DatabaseMailUserRole";
    sendMail.permissions.push_back(execute);
    catalog.add(SystemDatabase::MSDB, sendMail);

    auto objects = ObjectEnumerator::enumerate(source, SystemDatabase::MSDB,
                                               TransferPolicy());
    runner.assertFalse(containsObject(objects, "dbo"), "dbo user skipped");
    runner.assertFalse(containsObject(objects, "db_owner"),
                       "role without migrated members skipped");
    const ObjectDescriptor *role = findObject(objects, "db_datareader");
    runner.assertTrue(role != nullptr, "built-in role kept");
    runner.assertTrue(role && role->isGrantsOnly, "role marked grants-only");
    runner.assertCount(1, role ? role->members.size() : 0,
                       "built-in members dropped");
    const ObjectDescriptor *proc = findObject(objects, "dbo.sp_send_dbmail");
    runner.assertTrue(proc && proc->isGrantsOnly, "procedure marked grants-only");
    runner.assertCount(1, proc ? proc->permissions.size() : 0,
                       "only the grant to appUser kept");

    GenerationResult result =
        ScriptGenerator::generate(objects, TransferPolicy());
    std::vector<std::string> texts;
    for (const auto &statement : result.script)
      texts.push_back(statement.text);
    runner.assertCount(3, texts.size(), "user, membership and grant");
    runner.assertEquals("CREATE USER [appUser] FOR LOGIN [appLogin]", texts[0],
                        "user created");
    runner.assertEquals("ALTER ROLE [db_datareader] ADD MEMBER [appUser]",
                        texts[1], "membership emitted");
    runner.assertEquals(
        "GRANT EXECUTE ON OBJECT::[dbo].[sp_send_dbmail] TO [appUser]",
        texts[2], "grant emitted");
  });

  runner.runTest("Excluded categories are not enumerated", [&]() {
    FakeServer source("src");
    source.fakeCatalog().add(SystemDatabase::MSDB, makeTable("dbo", "Jobs"));
    source.fakeCatalog().add(SystemDatabase::MSDB,
                             makeProcedure("dbo", "spPurge"));

    TransferPolicy policy =
        TransferPolicy().withCategory(ObjectCategory::TABLE, false);
    auto objects =
        ObjectEnumerator::enumerate(source, SystemDatabase::MSDB, policy);
    runner.assertCount(1, objects.size(), "only the procedure");
    runner.assertFalse(containsObject(objects, "dbo.Jobs"), "table excluded");
  });

  runner.runTest("Objects come out in script stage order", [&]() {
    FakeServer source("src");
    auto &catalog = source.fakeCatalog();
    catalog.add(SystemDatabase::MASTER, makeUser("app", "app_login"));
    catalog.add(SystemDatabase::MASTER, makeProcedure("ops", "spB"));
    catalog.add(SystemDatabase::MASTER, makeProcedure("ops", "spA"));
    catalog.add(SystemDatabase::MASTER, makeTable("ops", "Audit"));
    catalog.add(SystemDatabase::MASTER, makeSchema("ops"));

    auto objects = ObjectEnumerator::enumerate(source, SystemDatabase::MASTER,
                                               TransferPolicy());
    runner.assertCount(5, objects.size(), "all objects");
    runner.assertEquals("ops", objects[0].qualifiedName(), "schema first");
    runner.assertEquals("ops.Audit", objects[1].qualifiedName(),
                        "table second");
    runner.assertEquals("ops.spA", objects[2].qualifiedName(),
                        "procedures sorted by name");
    runner.assertEquals("ops.spB", objects[3].qualifiedName(),
                        "second procedure");
    runner.assertEquals("app", objects[4].qualifiedName(), "user last");
  });

  runner.runTest("Dependencies of excluded categories are pulled in", [&]() {
    FakeServer source("src");
    auto &catalog = source.fakeCatalog();
    catalog.add(SystemDatabase::MASTER, makeProcedure("dbo", "spReport"));
    catalog.add(SystemDatabase::MASTER, makeTable("dbo", "Metrics"));
    catalog.add(SystemDatabase::MASTER, makeTable("dbo", "Unrelated"));
    catalog.addReference(SystemDatabase::MASTER, "dbo.spReport",
                         ObjectReference{ObjectCategory::TABLE, "dbo",
                                         "Metrics"});

    TransferPolicy policy = TransferPolicy()
                                .withCategory(ObjectCategory::TABLE, false)
                                .withFlag(PolicyFlag::INCLUDE_DEPENDENCIES, true);
    auto objects =
        ObjectEnumerator::enumerate(source, SystemDatabase::MASTER, policy);
    runner.assertCount(2, objects.size(), "procedure plus its table");
    const ObjectDescriptor *metrics = findObject(objects, "dbo.Metrics");
    runner.assertTrue(metrics != nullptr, "referenced table added");
    runner.assertTrue(metrics && metrics->isDependency,
                      "marked as dependency");
    runner.assertFalse(containsObject(objects, "dbo.Unrelated"),
                       "unreferenced table stays out");
  });

  runner.runTest("Dependency walk follows chains and survives cycles", [&]() {
    FakeServer source("src");
    auto &catalog = source.fakeCatalog();
    catalog.add(SystemDatabase::MASTER, makeProcedure("dbo", "spTop"));
    catalog.add(SystemDatabase::MASTER,
                makeObject(ObjectCategory::VIEW, "dbo", "vMiddle",
                           "CREATE VIEW dbo.vMiddle AS SELECT 1 AS x"));
    catalog.add(SystemDatabase::MASTER, makeTable("dbo", "Bottom"));
    catalog.addReference(SystemDatabase::MASTER, "dbo.spTop",
                         ObjectReference{ObjectCategory::VIEW, "dbo", "vMiddle"});
    catalog.addReference(SystemDatabase::MASTER, "dbo.vMiddle",
                         ObjectReference{ObjectCategory::TABLE, "dbo", "Bottom"});
    catalog.addReference(SystemDatabase::MASTER, "dbo.Bottom",
                         ObjectReference{ObjectCategory::VIEW, "dbo", "vMiddle"});

    TransferPolicy policy = TransferPolicy()
                                .withCategory(ObjectCategory::TABLE, false)
                                .withCategory(ObjectCategory::VIEW, false)
                                .withFlag(PolicyFlag::INCLUDE_DEPENDENCIES, true);
    auto objects =
        ObjectEnumerator::enumerate(source, SystemDatabase::MASTER, policy);
    runner.assertCount(3, objects.size(), "whole chain collected once");
    runner.assertEquals("dbo.Bottom", objects[0].qualifiedName(),
                        "table before view");
    runner.assertEquals("dbo.vMiddle", objects[1].qualifiedName(),
                        "view before procedure");
  });

  runner.runTest("Without includeDependencies references are ignored", [&]() {
    FakeServer source("src");
    auto &catalog = source.fakeCatalog();
    catalog.add(SystemDatabase::MASTER, makeProcedure("dbo", "spReport"));
    catalog.add(SystemDatabase::MASTER, makeTable("dbo", "Metrics"));
    catalog.addReference(SystemDatabase::MASTER, "dbo.spReport",
                         ObjectReference{ObjectCategory::TABLE, "dbo",
                                         "Metrics"});

    TransferPolicy policy =
        TransferPolicy().withCategory(ObjectCategory::TABLE, false);
    auto objects =
        ObjectEnumerator::enumerate(source, SystemDatabase::MASTER, policy);
    runner.assertCount(1, objects.size(), "procedure only");
  });

  runner.runTest("Enumeration is restartable", [&]() {
    FakeServer source("src");
    source.fakeCatalog().add(SystemDatabase::MODEL,
                             makeProcedure("dbo", "spTemplate"));
    auto first = ObjectEnumerator::enumerate(source, SystemDatabase::MODEL,
                                             TransferPolicy());
    auto second = ObjectEnumerator::enumerate(source, SystemDatabase::MODEL,
                                              TransferPolicy());
    runner.assertCount(first.size(), second.size(), "same size");
    runner.assertEquals(first[0].qualifiedName(), second[0].qualifiedName(),
                        "same object");
  });

  runner.runTest("Catalog read failures propagate", [&]() {
    FakeServer source("src");
    source.fakeCatalog().failReads = true;
    bool threw = false;
    try {
      ObjectEnumerator::enumerate(source, SystemDatabase::MASTER,
                                  TransferPolicy());
    } catch (const StatementError &e) {
      threw = true;
      runner.assertEquals("08S01", e.sqlState(), "SQLSTATE kept");
    }
    runner.assertTrue(threw, "StatementError raised");
  });

  runner.printSummary();
  return 0;
}
