#include "test_common.h"
#include "codeloop/hash.h"
#include "codeloop/log.h"
#include "codeloop/scratch.h"

#include <fstream>
#include <sstream>
#include <vector>

using namespace codeloop;

static std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string l;
    while (std::getline(in, l)) lines.push_back(l);
    return lines;
}

static void write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream out(path, std::ios::trunc);
    for (const auto& l : lines) out << l << "\n";
}

int main() {
    expect_eq_str(hash::sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "sha256 empty");
    expect_eq_str(hash::sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "sha256 abc");

    expect_eq_str(canonicalize_json("{\"b\":1,\"a\":{\"d\":[2,1],\"c\":null}}"),
                  "{\"a\":{\"c\":null,\"d\":[2,1]},\"b\":1}", "sorted keys");
    expect_eq_str(canonicalize_json("not json"), "not json", "unparsable passes through");

    std::string err;
    ScratchDir dir;
    expect_true(dir.create("", "codeloop_log_test_", &err), "scratch: " + err);
    const std::string path = (dir.path() / "run.jsonl").string();

    RunHeader hdr;
    hdr.run_id = "run_test";
    hdr.request_id = "req-1";
    hdr.profile = "dev";
    {
        JsonlLogger log(hdr, path);
        expect_true(log.ok(), "log opened");
        log.event(0, "run_start", "{\"request\":\"x\"}");
        log.event(1, "transition", "{\"to\":\"execute\",\"from\":\"generate\"}");
        log.event(2, "run_end", "{\"outcome\":\"satisfied\"}");
    }

    std::vector<std::string> lines = read_lines(path);
    expect_eq_ll((long long)lines.size(), 3, "three records");
    expect_true(contains(lines[1], "\"payload\":{\"from\":\"generate\",\"to\":\"execute\"}"), "payload canonical");
    expect_true(contains(lines[0], "\"log_version\":\"codeloop.runlog.v1\""), "version tagged");
    expect_true(verify_run_log(path, &err), "intact chain verifies: " + err);

    // edit a payload
    std::vector<std::string> edited = lines;
    const size_t pos = edited[1].find("execute");
    edited[1].replace(pos, 7, "evaluat");
    write_lines(path, edited);
    expect_true(!verify_run_log(path, &err), "edit detected");
    expect_true(contains(err, "line 2"), "first bad line named: " + err);

    // drop a record
    write_lines(path, {lines[0], lines[2]});
    expect_true(!verify_run_log(path, &err), "drop detected");

    // reorder
    write_lines(path, {lines[1], lines[0], lines[2]});
    expect_true(!verify_run_log(path, &err), "reorder detected");

    expect_true(!verify_run_log((dir.path() / "absent.jsonl").string(), &err), "missing file");

    std::cerr << "test_log: ALL PASSED" << std::endl;
    return 0;
}
