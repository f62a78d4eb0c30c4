// ==============================================================================
// dtf/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для цветного вывода
//
// Вся платформенная специфика изолирована в platform.cpp.
//
// ==============================================================================

#ifndef DTF_PLATFORM_HPP
#define DTF_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace dtf::platform {

/// Создать path из UTF-8 строки (argv, сохранённые сессии)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути (для сообщений и сессий)
std::string path_to_utf8(const std::filesystem::path& p);

/// stdout подключён к терминалу
bool is_tty_stdout();

/// stderr подключён к терминалу
bool is_tty_stderr();

}  // namespace dtf::platform

#endif  // DTF_PLATFORM_HPP
