#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace boxjudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout) throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    if (!fout) throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath == "." || subpath == ".." ||
        subpath.find('/') != string::npos || subpath.find('\0') != string::npos)
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

scoped_directory::scoped_directory() {}

scoped_directory::scoped_directory(const fs::path &path) : dir(path), valid(true) {
    fs::create_directories(dir);
}

scoped_directory::scoped_directory(scoped_directory &&other) {
    *this = move(other);
}

scoped_directory::~scoped_directory() {
    release();
}

scoped_directory &scoped_directory::operator=(scoped_directory &&other) {
    swap(dir, other.dir);
    swap(valid, other.valid);
    return *this;
}

const fs::path &scoped_directory::path() const {
    return dir;
}

void scoped_directory::keep() {
    valid = false;
}

bool scoped_directory::release() {
    if (!valid) return true;
    valid = false;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        LOG(ERROR) << "Unable to delete directory " << dir << ": " << ec.message();
        return false;
    }
    return true;
}

}  // namespace boxjudge
