/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#ifndef UTILPVT_H
#define UTILPVT_H

#include <sstream>
#include <string>
#include <vector>

#include <epicsThread.h>

#include <trustgen/version.h>

namespace trustgen {
namespace impl {

//! in-line string builder (eg. for exception messages)
//! eg. @code throw std::runtime_error(SB()<<"Some message"<<42); @endcode
struct SB {
    std::ostringstream strm;
    SB() {}
    operator std::string() const { return strm.str(); }
    std::string str() const { return strm.str(); }
    template<typename T>
    SB& operator<<(const T& i) { strm<<i; return *this; }
};

namespace detail {
template<void (*onceFn)()>
void onceTrampoline(void *) noexcept
{
    onceFn();
}
} // namespace detail

// run onceFn() exactly once per process.  onceFn() must not throw.
template<void (*onceFn)()>
void threadOnce() noexcept
{
    static epicsThreadOnceId id = EPICS_THREAD_ONCE_INIT;
    epicsThreadOnce(&id, &detail::onceTrampoline<onceFn>, nullptr);
}

// remove leading and trailing whitespace
std::string trim(const std::string& s);

// split on ',' and trim each element.  empty elements are dropped.
std::vector<std::string> splitList(const std::string& s);

// relative paths are interpreted relative to basedir.
// empty basedir or absolute path returns path unchanged.
std::string joinPath(const std::string& basedir, const std::string& path);

// directory part of path, or "." if none
std::string dirName(const std::string& path);

bool fileExists(const std::string& path);

// read entire file.  throws std::runtime_error
std::string readFile(const std::string& path);

/** Write a file by way of a temporary in the same directory.
 *
 *  Content is written to "<path>.tmp" which is renamed into place by commit().
 *  If commit() is never called, the temporary is removed by the destructor.
 *  All errors throw std::runtime_error including the path.
 */
class AtomicFile {
    std::string path, tmppath;
    int fd = -1;
    bool committed = false;
public:
    explicit AtomicFile(const std::string& path, unsigned mode = 0644);
    ~AtomicFile();
    AtomicFile(const AtomicFile&) = delete;
    AtomicFile& operator=(const AtomicFile&) = delete;

    void write(const void *buf, size_t len);
    inline void write(const std::string& s) { write(s.data(), s.size()); }

    // flush and close the temporary, but do not rename.
    void finish();
    // finish() if needed, then rename into place.
    void commit();

};

} // namespace impl
} // namespace trustgen

#endif // UTILPVT_H
