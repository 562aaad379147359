//
// OmegaException.hpp — exception carrying a typed payload, source location and backtrace
//

#ifndef CARDCLASH_OMEGAEXCEPTION_HPP
#define CARDCLASH_OMEGAEXCEPTION_HPP

#include <cstddef>
#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace clash::core
{
    // Thrown only for engine misuse and broken invariants; rule violations travel as values.
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        auto data() const noexcept -> T const& { return usr_data_; }

        // Location plus backtrace, skipping the frames spent inside the throw helpers.
        [[nodiscard]]
        auto to_str(std::size_t skip_tail = 3) const -> std::string
        {
            std::string s = std::format("{}({}:{}), function `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.column(), src_loc_.function_name());
            std::size_t const n = backtrace_.size() > skip_tail ? backtrace_.size() - skip_tail : 0;
            for (std::size_t i{}; i < n; ++i)
            {
                auto const& entry = backtrace_[i];
                s += std::format("{}({}):{}\n", entry.source_file(), entry.source_line(), entry.description());
            }
            return s;
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };
}

// Allows std::print("{}", e) on any OmegaException.
template <class T>
struct std::formatter<clash::core::OmegaException<T>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(clash::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("Failed with code ({}): {}\n{}", static_cast<int>(p.data()), p.what(),
                                    p.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //CARDCLASH_OMEGAEXCEPTION_HPP
