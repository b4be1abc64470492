#include <cassert>
#include <iostream>
#include <string>
#include "pdxloc/parser.hpp"
#include "pdxloc/diagnostics_json.hpp"

using namespace pdxloc;

static ParseResult run(const char* src, bool lenient=false){
    ParseOptions o; o.lenient = lenient;
    return Parser(o).parse_string(src, "json-test.yml");
}

static void test_json_success(){
    auto js = diagnostics_to_json(run("l_english:\n a: \"1\"\n"));
    assert(js.find("\"success\":true")!=std::string::npos);
    assert(js.find("\"errors\":[]")!=std::string::npos);
    assert(js.find("\"source\":\"json-test.yml\"")!=std::string::npos);
}

static void test_json_malformed_line(){
    auto js = diagnostics_to_json(run("l_english:\n a: \"1\"\n badline without quotes\n"));
    assert(js.find("\"success\":false")!=std::string::npos);
    assert(js.find("E0001")!=std::string::npos);
    assert(js.find("\"line\":3")!=std::string::npos);
    assert(js.find("\"lang\":\"english\"")!=std::string::npos);
    assert(js.find("\"text\":\" badline without quotes\"")!=std::string::npos);
}

static void test_json_warnings(){
    auto js = diagnostics_to_json(run("stray\nl_english:\n a: \"1\"\nl_english:\n b: \"2\"\n"));
    assert(js.find("W0100")!=std::string::npos);
    assert(js.find("W0101")!=std::string::npos);
    // warnings section follows the (empty) errors array
    auto warn = js.find("\"warnings\":[");
    assert(warn!=std::string::npos && js.find("W0100")>warn);
}

static void test_json_records(){
    auto r = run("l_english:\n greeting.1.t: \"Hello\"\n greeting.1.d:0 \"Line\\nbreak\"\n");
    auto js = localizations_to_json(r.localizations);
    assert(js.find("\"lang\":\"english\"")!=std::string::npos);
    assert(js.find("\"version\":null")!=std::string::npos);
    assert(js.find("\"version\":0")!=std::string::npos);
    // literal backslash-n stays two characters and is escaped once for JSON
    assert(js.find("\"Line\\\\nbreak\"")!=std::string::npos);
    auto full = result_to_json(r);
    assert(full.find("\"localizations\":[{")!=std::string::npos);
}

static void test_json_escape(){
    assert(json_escape("a\"b")=="\"a\\\"b\"");
    assert(json_escape("tab\t")=="\"tab\\t\"");
    assert(json_escape(std::string(1, '\x01'))=="\"\\u0001\"");
}

int run_diagnostics_json_tests(){
    std::cout << "[pdxloc] diagnostics JSON tests...\n";
    test_json_success();
    test_json_malformed_line();
    test_json_warnings();
    test_json_records();
    test_json_escape();
    std::cout << "[pdxloc] diagnostics JSON tests passed\n";
    return 0;
}
