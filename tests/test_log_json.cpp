#include "test_common.h"

#include "execd/json_util.h"
#include "execd/log.h"
#include "execd/types.h"

#include <json-c/json.h>

#include <filesystem>
#include <fstream>
#include <vector>

using namespace execd;

static std::vector<std::string> read_lines(const std::filesystem::path& p) {
    std::ifstream f(p);
    std::vector<std::string> out;
    std::string line;
    while (std::getline(f, line)) out.push_back(line);
    return out;
}

static void test_jsonl_logger(const std::filesystem::path& dir) {
    auto p = dir / "events.jsonl";
    {
        JsonlLogger log(p.string());
        expect_true(log.is_open(), "logger opens");
        json_object* payload = json_object_new_object();
        json_object_object_add(payload, "exit_code", json_object_new_int(0));
        log.event("session_exit", "abc", payload);
        log.event("session_interrupt", "abc", nullptr);
    }
    {
        // reopening appends
        JsonlLogger log(p.string());
        log.event("session_pruned", "def", nullptr);
    }

    auto lines = read_lines(p);
    expect_eq_ll((long long)lines.size(), 3, "three event lines");

    json_util::Doc first = json_util::parse(lines[0]);
    expect_true(first.is_object(), "line is a JSON object");
    expect_true(json_util::get_string(first, "event").value_or("") == "session_exit", "event name");
    expect_true(json_util::get_string(first, "session_id").value_or("") == "abc", "session id");
    expect_eq_ll(json_util::get_int(first, "seq").value_or(-1), 1, "seq starts at 1");
    json_object* payload = json_util::member(first, "payload");
    expect_true(payload && json_object_is_type(payload, json_type_object), "payload object");
    json_object* code = nullptr;
    expect_true(json_object_object_get_ex(payload, "exit_code", &code) && json_object_get_int(code) == 0,
                "payload carried");

    json_util::Doc second = json_util::parse(lines[1]);
    expect_eq_ll(json_util::get_int(second, "seq").value_or(-1), 2, "seq increments");
    json_object* empty = json_util::member(second, "payload");
    expect_true(empty && json_object_object_length(empty) == 0, "null payload becomes {}");

    auto ts = json_util::get_string(second, "ts").value_or("");
    expect_true(ts.size() == 24 && ts.back() == 'Z', "ts is RFC 3339 with millis: " + ts);

    JsonlLogger bad((dir / "missing" / "x.jsonl").string());
    expect_true(!bad.is_open(), "unopenable path reported");
    bad.event("session_exit", "x", json_object_new_object());
}

static void test_json_util() {
    json_util::Doc d = json_util::parse(
        "{\"s\":\"v\",\"b\":true,\"i\":42,\"envs\":{\"A\":\"1\",\"B\":\"x=y\",\"N\":3}}");
    expect_true(d.is_object(), "parse object");
    expect_true(json_util::get_string(d, "s").value_or("") == "v", "get_string");
    expect_true(json_util::get_bool(d, "b").value_or(false), "get_bool");
    expect_eq_ll(json_util::get_int(d, "i").value_or(0), 42, "get_int");
    expect_true(!json_util::get_string(d, "i").has_value(), "type mismatch is nullopt");
    expect_true(!json_util::get_string(d, "nope").has_value(), "absent is nullopt");

    auto env = json_util::get_env_entries(d, "envs");
    expect_true(env.has_value(), "env object");
    expect_eq_ll((long long)env->size(), 2, "non-string env values skipped");
    bool has_a = false, has_b = false;
    for (const auto& e : *env) {
        if (e == "A=1") has_a = true;
        if (e == "B=x=y") has_b = true;
    }
    expect_true(has_a && has_b, "env entries formatted K=V");
    auto missing = json_util::get_env_entries(d, "absent");
    expect_true(missing && missing->empty(), "absent env is empty");
    expect_true(!json_util::get_env_entries(d, "s").has_value(), "non-object env rejected");

    expect_true(!json_util::parse("{broken").is_object(), "broken JSON");
    expect_true(!json_util::parse("[1,2]").is_object(), "array is not an object");

    expect_true(json_util::json_escape("a\"b\\c\n\x01") == "a\\\"b\\\\c\\n\\u0001", "json_escape");
}

static void test_status_json() {
    CommandStatus st;
    st.session_id = "id1";
    st.running = false;
    st.exit_code = 7;
    st.started_at = Clock::time_point(std::chrono::milliseconds(1700000000123LL));
    st.finished_at = st.started_at + std::chrono::seconds(2);

    json_util::Doc d = json_util::parse(status_to_json(st));
    expect_true(d.is_object(), "status json parses");
    expect_true(json_util::get_string(d, "id").value_or("") == "id1", "status id");
    expect_true(json_util::get_bool(d, "running").has_value() && !*json_util::get_bool(d, "running"), "status running");
    expect_eq_ll(json_util::get_int(d, "exit_code").value_or(-1), 7, "status exit_code");
    expect_true(!json_util::member(d, "error"), "no error key when empty");
    expect_true(json_util::get_string(d, "started_at").value_or("") == "2023-11-14T22:13:20.123Z", "started_at");
    expect_true(json_util::get_string(d, "finished_at").value_or("") == "2023-11-14T22:13:22.123Z", "finished_at");

    CommandStatus running;
    running.session_id = "id2";
    running.running = true;
    running.error = "terminated by signal 9";
    json_util::Doc r = json_util::parse(status_to_json(running));
    expect_true(!json_util::member(r, "exit_code"), "running has no exit_code");
    expect_true(!json_util::member(r, "finished_at"), "running has no finished_at");
    expect_true(json_util::get_string(r, "error").value_or("") == "terminated by signal 9", "error carried");
}

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "execd_test_log_json";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);

    test_jsonl_logger(dir);
    test_json_util();
    test_status_json();

    fs::remove_all(dir, ec);
    std::cerr << "test_log_json: ALL PASSED" << std::endl;
    return 0;
}
