/**
 * @file Credentials.hpp
 * @brief Разрешение имен пользователей/групп и сброс привилегий
 */

#pragma once

#include <sys/types.h>

#include <optional>
#include <string>

namespace sockd {

struct UserIds {
  uid_t uid;
  gid_t gid;  ///< основная группа пользователя
};

/**
 * @brief Найти пользователя по имени
 * @throw ServiceError(PrivilegeError) если пользователь не найден
 */
UserIds resolveUser(const std::string& user);

/**
 * @brief Найти группу по имени
 * @throw ServiceError(PrivilegeError) если группа не найдена
 */
gid_t resolveGroup(const std::string& group);

/**
 * @struct Ownership
 * @brief Итоговые uid/gid для chown; отсутствующее значение не меняется
 *
 * @details Если группа не задана явно, используется основная группа
 * пользователя.
 */
struct Ownership {
  std::optional<uid_t> uid;
  std::optional<gid_t> gid;

  bool empty() const { return !uid && !gid; }
};

Ownership resolveOwnership(const std::optional<std::string>& user,
                           const std::optional<std::string>& group);

/**
 * @brief Сбросить привилегии процесса: сначала группа, затем пользователь
 *
 * @throw ServiceError(PrivilegeError) если имя не разрешается или ядро
 * отклоняет setgid/setuid
 *
 * @note Порядок обязателен: после setuid() процесс уже не сможет сменить
 * группу.
 */
void dropPrivileges(const std::optional<std::string>& user,
                    const std::optional<std::string>& group);

}  // namespace sockd
