#include "core/sync_errors.h"
#include "test_runner.h"
#include <new>

int main() {
  TestRunner runner;
  runner.printHeader("SYNC ERRORS");

  runner.runTest("describe carries kind, unit and operation", [&]() {
    SchemaError error("table missing", "shop.orders", "introspect");
    runner.assertEquals("[SchemaError] shop.orders/introspect: table missing",
                        error.describe(), "Full context");
    SystemError bare("out of memory");
    runner.assertEquals("[SystemError] out of memory", bare.describe(),
                        "No context");
  });

  runner.runTest("classifyException keeps SyncError kinds", [&]() {
    std::exception_ptr ptr;
    try {
      throw ProvisionError("denied", "idx", "create");
    } catch (...) {
      ptr = std::current_exception();
    }
    SyncError classified = classifyException(ptr, "fallback", "op");
    runner.assertTrue(classified.kind() == ErrorKind::Provision, "Kind kept");
    runner.assertEquals("idx", classified.unit(), "Unit kept");
  });

  runner.runTest("Foreign exceptions become system errors", [&]() {
    std::exception_ptr ptr;
    try {
      throw std::bad_alloc();
    } catch (...) {
      ptr = std::current_exception();
    }
    SyncError classified = classifyException(ptr, "shop.orders", "write");
    runner.assertTrue(classified.kind() == ErrorKind::System,
                      "Allocation failure is a system error");
    runner.assertEquals("shop.orders", classified.unit(), "Unit supplied");

    try {
      throw std::runtime_error("strange");
    } catch (...) {
      ptr = std::current_exception();
    }
    runner.assertTrue(classifyException(ptr, "u", "op").kind() ==
                          ErrorKind::System,
                      "Unknown failures are system errors");
  });

  runner.runTest("Kind names", [&]() {
    runner.assertEquals("ConnectionError",
                        errorKindToString(ErrorKind::Connection), "Connection");
    runner.assertEquals("size_limit",
                        recordFailureKindToString(RecordFailureKind::SizeLimit),
                        "Size limit");
  });

  return runner.printSummary();
}
