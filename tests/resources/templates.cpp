/// @file templates.cpp
/// @brief URI template matching and the resource manager

#include "minimcp/resources/manager.hpp"
#include "minimcp/resources/template.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace minimcp;
using namespace minimcp::resources;

static ResourceTemplate make_template(const std::string& uri_template)
{
    ResourceTemplate t;
    t.uri_template = uri_template;
    t.name = uri_template;
    t.parse();
    return t;
}

void test_extract_params()
{
    auto names = extract_params("weather://{city}/{day}/forecast");
    assert(names.size() == 2);
    assert(names[0] == "city");
    assert(names[1] == "day");

    auto wildcard = extract_params("file:///{path*}");
    assert(wildcard.size() == 1 && wildcard[0] == "path");
    std::cout << "[PASS] extract_params\n";
}

void test_single_segment_match()
{
    auto t = make_template("weather://{city}/current");

    auto m = t.match("weather://Tokyo/current");
    assert(m);
    assert(m->at("city") == "Tokyo");

    assert(!t.match("weather://Tokyo/forecast"));
    assert(!t.match("weather://a/b/current"));
    assert(!t.match("weather:///current"));
    std::cout << "[PASS] single segment match\n";
}

void test_values_are_url_decoded()
{
    auto t = make_template("weather://{city}/current");

    auto m = t.match("weather://New%20York/current");
    assert(m && m->at("city") == "New York");

    auto plus = t.match("weather://San+Francisco/current");
    assert(plus && plus->at("city") == "San Francisco");

    // Only two hex digits form an escape; signs and spaces stay literal
    assert(url_decode("%41%7e") == "A~");
    assert(url_decode("%+1") == "%+1");
    assert(url_decode("% 1") == "% 1");
    assert(url_decode("%-f") == "%-f");
    assert(url_decode("100%") == "100%");
    std::cout << "[PASS] url decoding\n";
}

void test_literal_text_is_escaped()
{
    auto t = make_template("docs://v1.0/{page}");
    assert(t.match("docs://v1.0/intro"));
    assert(!t.match("docs://v1x0/intro"));
    std::cout << "[PASS] literal escaping\n";
}

void test_wildcard_spans_segments()
{
    auto t = make_template("file:///{path*}");
    auto m = t.match("file:///etc/hosts");
    assert(m && m->at("path") == "etc/hosts");
    std::cout << "[PASS] wildcard\n";
}

void test_expand()
{
    auto t = make_template("weather://{city}/current");
    assert(t.expand({{"city", "test"}}) == "weather://test/current");
    assert(t.expand({{"city", "New York"}}) == "weather://New%20York/current");
    std::cout << "[PASS] expand\n";
}

void test_malformed_template_rejected()
{
    bool threw = false;
    try
    {
        make_template("weather://{city/current");
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    assert(threw);

    threw = false;
    try
    {
        make_template("weather://{}/current");
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] malformed templates\n";
}

void test_manager_order_and_replacement()
{
    ResourceManager rm;
    rm.register_resource(Resource{"b://two", "Two", std::nullopt, std::nullopt});
    rm.register_resource(Resource{"a://one", "One", std::string("text/plain"), std::nullopt});
    rm.register_resource(Resource{"b://two", "Two v2", std::nullopt, std::string("updated")});

    const auto& list = rm.list();
    assert(list.size() == 2);
    assert(list[0].uri == "b://two");
    assert(list[0].name == "Two v2");
    assert(list[1].uri == "a://one");
    assert(rm.has("a://one"));
    assert(rm.get("a://one").mime_type == std::optional<std::string>("text/plain"));

    // Optional fields are omitted, not nulled
    Json first = list[1];
    assert(first["mime_type"] == "text/plain");
    assert(!first.contains("description"));

    rm.register_template(make_template("x://{id}"));
    rm.register_template(make_template("x://{id}/raw"));
    rm.register_template(make_template("x://{id}"));
    assert(rm.list_templates().size() == 2);

    auto matched = rm.match_template("x://42/raw");
    assert(matched);
    assert(matched->first->uri_template == "x://{id}/raw");
    assert(matched->second.at("id") == "42");
    assert(!rm.match_template("y://42"));
    std::cout << "[PASS] resource manager\n";
}

int main()
{
    test_extract_params();
    test_single_segment_match();
    test_values_are_url_decoded();
    test_literal_text_is_escaped();
    test_wildcard_spans_segments();
    test_expand();
    test_malformed_template_rejected();
    test_manager_order_and_replacement();
    return 0;
}
