/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#include <stdexcept>

#include <errno.h>
#include <string.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

#include <openssl/opensslv.h>

#include <trustgen/log.h>
#include "utilpvt.h"

DEFINE_LOGGER(_log, "trustgen.util");

#define TRUSTGEN_STR2(X) #X
#define TRUSTGEN_STR(X) TRUSTGEN_STR2(X)

namespace trustgen {

const char *version_str()
{
    return "trustgen "
            TRUSTGEN_STR(TRUSTGEN_MAJOR_VERSION) "."
            TRUSTGEN_STR(TRUSTGEN_MINOR_VERSION) "."
            TRUSTGEN_STR(TRUSTGEN_MAINTENANCE_VERSION)
            " (" OPENSSL_VERSION_TEXT ")";
}

unsigned long version_int()
{
    return TRUSTGEN_VERSION;
}

namespace impl {

std::string trim(const std::string& s)
{
    static const char ws[] = " \t\r\n";
    auto first(s.find_first_not_of(ws));
    if(first==std::string::npos)
        return std::string();
    auto last(s.find_last_not_of(ws));
    return s.substr(first, last-first+1u);
}

std::vector<std::string> splitList(const std::string& s)
{
    std::vector<std::string> ret;
    size_t pos = 0u;
    while(pos<=s.size()) {
        auto sep(s.find_first_of(',', pos));
        if(sep==std::string::npos)
            sep = s.size();
        auto elem(trim(s.substr(pos, sep-pos)));
        if(!elem.empty())
            ret.push_back(elem);
        pos = sep+1u;
    }
    return ret;
}

std::string joinPath(const std::string& basedir, const std::string& path)
{
    if(basedir.empty() || path.empty() || path[0]=='/')
        return path;
    if(basedir[basedir.size()-1u]=='/')
        return basedir + path;
    return basedir + '/' + path;
}

std::string dirName(const std::string& path)
{
    auto sep(path.find_last_of('/'));
    if(sep==std::string::npos)
        return ".";
    else if(sep==0u)
        return "/";
    return path.substr(0, sep);
}

bool fileExists(const std::string& path)
{
    struct stat info;
    return ::stat(path.c_str(), &info)==0;
}

std::string readFile(const std::string& path)
{
    int fd = ::open(path.c_str(), O_RDONLY|O_CLOEXEC);
    if(fd<0) {
        auto err = errno;
        throw std::runtime_error(SB()<<"Unable to open \""<<path<<"\" : "<<strerror(err));
    }
    std::string ret;
    char buf[1024];
    while(true) {
        auto n = ::read(fd, buf, sizeof(buf));
        if(n<0 && errno==EINTR) {
            continue;
        } else if(n<0) {
            auto err = errno;
            (void)::close(fd);
            throw std::runtime_error(SB()<<"Unable to read \""<<path<<"\" : "<<strerror(err));
        } else if(n==0) {
            break;
        }
        ret.append(buf, size_t(n));
    }
    (void)::close(fd);
    return ret;
}

AtomicFile::AtomicFile(const std::string& path, unsigned mode)
    :path(path)
    ,tmppath(path + ".tmp")
{
    if(path.empty())
        throw std::runtime_error("Empty output file name");

    fd = ::open(tmppath.c_str(), O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC, mode_t(mode));
    if(fd<0) {
        auto err = errno;
        throw std::runtime_error(SB()<<"Unable to open for write \""<<tmppath<<"\" : "<<strerror(err));
    }
    // umask may have masked off bits.  Also, O_CREAT does not apply mode to a pre-existing file.
    if(::fchmod(fd, mode_t(mode))) {
        auto err = errno;
        (void)::close(fd);
        (void)::unlink(tmppath.c_str());
        throw std::runtime_error(SB()<<"Unable to set permissions on \""<<tmppath<<"\" : "<<strerror(err));
    }
    log_debug_printf(_log, "Writing %s\n", tmppath.c_str());
}

AtomicFile::~AtomicFile()
{
    if(fd>=0)
        (void)::close(fd);
    if(!committed) {
        if(::unlink(tmppath.c_str())==0)
            log_debug_printf(_log, "Discard %s\n", tmppath.c_str());
    }
}

void AtomicFile::write(const void *buf, size_t len)
{
    if(fd<0)
        throw std::logic_error(SB()<<"Write after finish() to \""<<tmppath<<"\"");

    auto cbuf = static_cast<const char*>(buf);
    while(len) {
        auto n = ::write(fd, cbuf, len);
        if(n<0 && errno==EINTR) {
            continue;
        } else if(n<0) {
            auto err = errno;
            throw std::runtime_error(SB()<<"Error writing \""<<tmppath<<"\" : "<<strerror(err));
        }
        cbuf += n;
        len -= size_t(n);
    }
}

void AtomicFile::finish()
{
    if(fd<0)
        return;
    int ret = ::fsync(fd);
    int err = errno;
    if(::close(fd) && !ret) {
        ret = -1;
        err = errno;
    }
    fd = -1;
    if(ret)
        throw std::runtime_error(SB()<<"Error flushing \""<<tmppath<<"\" : "<<strerror(err));
}

void AtomicFile::commit()
{
    finish();
    if(::rename(tmppath.c_str(), path.c_str())) {
        auto err = errno;
        throw std::runtime_error(SB()<<"Unable to rename \""<<tmppath<<"\" -> \""<<path<<"\" : "<<strerror(err));
    }
    committed = true;
    log_debug_printf(_log, "Wrote %s\n", path.c_str());
}

} // namespace impl
} // namespace trustgen
