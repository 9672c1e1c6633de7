#include "sockd/Credentials.hpp"

#include <grp.h>
#include <pwd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "sockd/ServiceError.hpp"

namespace sockd {

UserIds resolveUser(const std::string& user) {
    errno = 0;
    const passwd* entry = getpwnam(user.c_str());
    if (!entry) {
        throw ServiceError(ErrorKind::PrivilegeError, "unable to find user: " + user);
    }
    return UserIds{entry->pw_uid, entry->pw_gid};
}

gid_t resolveGroup(const std::string& group) {
    errno = 0;
    const struct group* entry = getgrnam(group.c_str());
    if (!entry) {
        throw ServiceError(ErrorKind::PrivilegeError, "unable to find group: " + group);
    }
    return entry->gr_gid;
}

Ownership resolveOwnership(const std::optional<std::string>& user,
                           const std::optional<std::string>& group) {
    Ownership result;
    if (user) {
        const UserIds ids = resolveUser(*user);
        result.uid = ids.uid;
        result.gid = ids.gid;
    }
    if (group) {
        result.gid = resolveGroup(*group);
    }
    return result;
}

void dropPrivileges(const std::optional<std::string>& user,
                    const std::optional<std::string>& group) {
    const Ownership ids = resolveOwnership(user, group);

    if (ids.gid) {
        // Дополнительные группы root не должны пережить смену пользователя
        if (geteuid() == 0) {
            const gid_t groups[] = {*ids.gid};
            if (setgroups(1, groups) < 0) {
                throw ServiceError(ErrorKind::PrivilegeError,
                    std::string("unable to drop privileges (setgroups: ") + std::strerror(errno) + ")");
            }
        }
        if (setgid(*ids.gid) < 0) {
            throw ServiceError(ErrorKind::PrivilegeError,
                std::string("unable to drop privileges (setgid: ") + std::strerror(errno) + ")");
        }
    }
    if (ids.uid) {
        if (setuid(*ids.uid) < 0) {
            throw ServiceError(ErrorKind::PrivilegeError,
                std::string("unable to drop privileges (setuid: ") + std::strerror(errno) + ")");
        }
    }
}

} // namespace sockd
