/// @file dispatcher.cpp
/// @brief Dispatcher: method routing and error-to-response translation

#include "minimcp/exceptions.hpp"
#include "minimcp/mcp/dispatcher.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace minimcp;
using minimcp::mcp::Dispatcher;
using minimcp::protocol::Request;

static Request make_request(Json id, const std::string& method, Json params = Json::object())
{
    Request req;
    req.id = std::move(id);
    req.method = method;
    req.params = std::move(params);
    return req;
}

int main()
{
    server::Registry registry;
    std::vector<std::string> observed;
    Dispatcher dispatcher(registry, [&](const std::exception& e) { observed.push_back(e.what()); });

    registry.register_handler("add", [](const Json& p)
                              { return Json(p.at("a").get<int>() + p.at("b").get<int>()); });
    registry.register_handler("reject", [](const Json&) -> Json
                              { throw InvalidParamsError("days out of range", Json{{"max", 5}}); });
    registry.register_handler("boom", [](const Json&) -> Json
                              { throw std::runtime_error("disk on fire"); });

    // Test 1: success carries the handler's result and echoes the id
    {
        auto resp = dispatcher.dispatch(make_request(Json("a-1"), "add", Json{{"a", 2}, {"b", 3}}));
        assert(!resp.is_error());
        assert(resp.id() == "a-1");
        assert(resp.result() == 5);
        std::cout << "[PASS] Test 1: success\n";
    }

    // Test 2: unknown method
    {
        auto resp = dispatcher.dispatch(make_request(Json(2), "nope"));
        assert(resp.is_error());
        assert(resp.id() == 2);
        assert(resp.error().code == -32601);
        assert(resp.error().message == "Method not found: nope");
        assert(!resp.error().data);
        std::cout << "[PASS] Test 2: method not found\n";
    }

    // Test 3: protocol errors are forwarded verbatim and not observed
    {
        auto resp = dispatcher.dispatch(make_request(Json(3), "reject"));
        assert(resp.is_error());
        assert(resp.error().code == -32602);
        assert(resp.error().message == "days out of range");
        assert(resp.error().data && (*resp.error().data)["max"] == 5);
        assert(observed.empty());
        std::cout << "[PASS] Test 3: protocol error forwarded\n";
    }

    // Test 4: other failures are observed once and become InternalError
    {
        auto resp = dispatcher.dispatch(make_request(Json(4), "boom"));
        assert(resp.is_error());
        assert(resp.error().code == -32603);
        assert(resp.error().message == "Internal error: disk on fire");
        assert(observed.size() == 1);
        assert(observed[0] == "disk on fire");
        std::cout << "[PASS] Test 4: internal error\n";
    }

    // Test 5: failures inside a handler's own lookups (nlohmann exceptions) are internal too
    {
        auto resp = dispatcher.dispatch(make_request(Json(5), "add", Json{{"a", 1}}));
        assert(resp.is_error());
        assert(resp.error().code == -32603);
        assert(observed.size() == 2);
        std::cout << "[PASS] Test 5: handler lookup failure\n";
    }

    // Test 6: replacing the observer
    {
        int replaced = 0;
        dispatcher.set_error_observer([&](const std::exception&) { ++replaced; });
        dispatcher.dispatch(make_request(Json(6), "boom"));
        assert(replaced == 1);
        assert(observed.size() == 2);

        dispatcher.set_error_observer({});
        auto resp = dispatcher.dispatch(make_request(Json(7), "boom"));
        assert(resp.error().code == -32603);
        std::cout << "[PASS] Test 6: observer replacement\n";
    }

    // Test 7: a handler may replace its own method while it runs
    {
        registry.register_handler("once",
                                  [&registry](const Json&) -> Json
                                  {
                                      registry.register_handler("once", [](const Json&)
                                                                { return Json("second"); });
                                      return Json("first");
                                  });
        assert(dispatcher.dispatch(make_request(Json(8), "once")).result() == "first");
        assert(dispatcher.dispatch(make_request(Json(9), "once")).result() == "second");
        std::cout << "[PASS] Test 7: self re-registration\n";
    }

    // Test 8: non-standard exceptions still get an InternalError reply
    {
        registry.register_handler("throws_int", [](const Json&) -> Json { throw 42; });
        std::vector<std::string> seen;
        dispatcher.set_error_observer([&](const std::exception& e) { seen.push_back(e.what()); });

        auto resp = dispatcher.dispatch(make_request(Json(1), "throws_int"));
        assert(resp.is_error());
        assert(resp.id() == 1);
        assert(resp.error().code == -32603);
        assert(resp.error().message == "Internal error: unknown exception");
        assert(seen.size() == 1 && seen[0] == "unknown exception");

        auto handle = mcp::make_line_handler(dispatcher);
        auto first = Json::parse(handle(R"({"id":1,"method":"throws_int"})"));
        assert(first["id"] == 1);
        assert(first["error"]["code"] == -32603);
        auto second = Json::parse(handle(R"({"id":2,"method":"add","params":{"a":1,"b":2}})"));
        assert(second["id"] == 2);
        assert(second["result"] == 3);
        dispatcher.set_error_observer({});
        std::cout << "[PASS] Test 8: non-standard exception\n";
    }

    // Test 9: a failing observer does not cost the reply
    {
        dispatcher.set_error_observer([](const std::exception&) { throw std::logic_error("observer broke"); });
        auto resp = dispatcher.dispatch(make_request(Json(2), "boom"));
        assert(resp.error().code == -32603);
        assert(resp.error().message == "Internal error: disk on fire");

        dispatcher.set_error_observer([](const std::exception&) { throw 7; });
        auto other = dispatcher.dispatch(make_request(Json(3), "throws_int"));
        assert(other.error().message == "Internal error: unknown exception");
        dispatcher.set_error_observer({});
        std::cout << "[PASS] Test 9: throwing observer\n";
    }

    // Test 10: line handling
    {
        auto handle = mcp::make_line_handler(dispatcher);

        auto parse_err = Json::parse(handle("not json"));
        assert(parse_err["error"]["code"] == -32700);
        assert(parse_err["id"].is_null());
        assert(!parse_err.contains("result"));

        auto invalid = Json::parse(handle(R"({"id":11,"params":{}})"));
        assert(invalid["error"]["code"] == -32600);
        assert(invalid["id"] == 11);

        auto ok = Json::parse(handle(R"({"jsonrpc":"2.0","id":12,"method":"add","params":{"a":1,"b":1}})"));
        assert(ok["jsonrpc"] == "2.0");
        assert(ok["id"] == 12);
        assert(ok["result"] == 2);

        // No id: still answered, with a null id
        auto no_id = Json::parse(handle(R"({"method":"add","params":{"a":0,"b":0}})"));
        assert(no_id.contains("id") && no_id["id"].is_null());
        assert(no_id["result"] == 0);
        std::cout << "[PASS] Test 10: line handling\n";
    }

    std::cout << "\nAll dispatcher tests passed!\n";
    return 0;
}
