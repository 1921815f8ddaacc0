#include "stringio.hpp"
#include <cctype>
#include <sstream>

using namespace std;

namespace stringio {

vector<string> &split(const string &s, char delim, vector<string> &elems) {
    stringstream ss(s);
    string item;
    while (std::getline(ss, item, delim)) {
        elems.push_back(item);
    }
    return elems;
}

vector<string> split(const string &s, char delim) {
    vector<string> elems;
    split(s, delim, elems);
    return elems;
}

vector<string> splitWhitespace(const string &s) {
    vector<string> elems;
    stringstream ss(s);
    string item;
    while (ss >> item) {
        elems.push_back(item);
    }
    return elems;
}

string trim(const string &s) {
    size_t first = 0;
    size_t last = s.size();
    while (first < last && isspace(static_cast<unsigned char>(s[first])))
        first++;
    while (last > first && isspace(static_cast<unsigned char>(s[last-1])))
        last--;
    return s.substr(first, last-first);
}

bool startsWith(const string &s, const string &prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

/** Deals with different line endings used on Linux, Mac, Windows platforms */
istream& safeGetline(istream& is, string& t)
{
    t.clear();

    // The characters in the stream are read one-by-one using a std::streambuf.
    // That is faster than reading them one-by-one using the std::istream.
    // Code that uses streambuf this way must be guarded by a sentry object.
    // The sentry object performs various tasks,
    // such as thread synchronization and updating the stream state.

    istream::sentry se(is, true);
    streambuf* sb = is.rdbuf();

    for(;;) {
        int c = sb->sbumpc();
        switch (c) {
        case '\n':
            return is;
        case '\r':
            if(sb->sgetc() == '\n')
                sb->sbumpc();
            return is;
        case EOF:
            // Also handle the case when the last line has no line ending
            if(t.empty())
                is.setstate(ios::eofbit);
            return is;
        default:
            t += (char)c;
        }
    }
}

} /* namespace stringio */
