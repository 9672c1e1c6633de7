/**
 * @file ControlProtocol.hpp
 * @brief Кадрирование сообщений управляющего канала
 *
 * @details Каждое сообщение - одна текстовая строка. Исходящий кадр
 * завершается CRLF, входящий очищается от завершающего \r\n, \n или \r.
 * На одно соединение приходится ровно один запрос и один ответ.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace sockd::protocol {

/// Зарезервированный запрос проверки живости; обрабатывается до приложения
inline constexpr const char* kPingRequest = "ping";
inline constexpr const char* kPongResponse = "pong";
inline constexpr const char* kTerminator = "\r\n";

/// Сколько байт запроса просматривается без извлечения из сокета
inline constexpr std::size_t kPeekSize = 256;

/// Ожидание первых данных от клиента после accept()
inline constexpr std::chrono::milliseconds kReadReadinessTimeout{2000};

/**
 * @brief Дополнить сообщение терминатором CRLF
 */
std::string frame(const std::string& message);

/**
 * @brief Удалить один завершающий терминатор строки
 *
 * @code
 * trimFrame("ping\r\n");  // "ping"
 * trimFrame("ping\n");    // "ping"
 * trimFrame("a\r\nb");    // "a\r\nb"
 * @endcode
 */
std::string trimFrame(const std::string& raw);

/// true, если кадр без терминатора равен "ping"
bool isPing(const std::string& raw);

}  // namespace sockd::protocol
