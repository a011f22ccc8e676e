//
// OmegaException.hpp: exception carrying a payload, source location and backtrace
//

#ifndef BLUFFGAME_OMEGAEXCEPTION_HPP
#define BLUFFGAME_OMEGAEXCEPTION_HPP

#include <cstddef>
#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace bluff::core
{
    // frames kept from the throw site upwards; the runtime's start-up frames are never useful
    inline constexpr std::size_t OmegaTraceDepth = 24;

    //inspired by CPPCon2023 "Exceptionally bad" by Peter Muldoon
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current(1, OmegaTraceDepth)) :
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

        auto data() const noexcept -> T const& { return usr_data_; }

        // throw site on the first line, then one line per captured frame
        [[nodiscard]]
        auto trace() const -> std::string
        {
            std::string s = std::format("at {}:{} in `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.function_name());
            for (std::stacktrace_entry const& entry : backtrace_)
            {
                if (entry.source_file().empty())
                    s += std::format("  {}\n", entry.description());
                else
                    s += std::format("  {}:{} {}\n", entry.source_file(), entry.source_line(), entry.description());
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

//extension to std format to allow use with std::print();
template <class T>
struct std::formatter<bluff::core::OmegaException<T>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(bluff::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("[code {}] {}\n{}", static_cast<int>(p.data()), p.what(), p.trace());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //BLUFFGAME_OMEGAEXCEPTION_HPP
