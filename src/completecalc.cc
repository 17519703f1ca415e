#include "complete_number.hh"
#include <cstdio>
#include <cstdint>
#include <cstring>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

const char* command_list_format = R"(Command list format:
'#' starts a comment row and is not parsed.

'real <name> <real> [<vanished>]' defines a real complete number.
'complex <name> <re> <im> [<vanished-re> <vanished-im>]' defines a complex
    complete number.
'add <dst> <a> <b>' and 'sub <dst> <a> <b>' add or subtract two numbers.
'mul <dst> <a> <b>' multiplies two numbers; if <b> is a literal number, <a> is
    scaled by it instead.
'div <dst> <a> <divisor>' divides by a literal number. Dividing by zero
    recovers the vanished part.
'absorb-real <dst> <a> <factor>' and 'absorb-imag <dst> <a> <factor>' only
    scale the real or imaginary axis.
'neg <dst> <a>' negates a number.
'lift <dst> <a>' converts a real number into a complex one.
'print <name>...' prints the given numbers.
'standard <name>' and 'vanished <name>' print the standard or vanished part.
'expect <a> <b>' fails unless the two numbers are equal.
)";

struct context
{
    std::map<std::string, complete_number> values;
};

bool read_binary_file(const char* path, std::vector<uint8_t>& data)
{
    FILE* f = fopen(path, "rb");

    if(!f) return false;

    // Directories open fine on Linux, but can't be seeked or told.
    long size = -1;
    if(fseek(f, 0, SEEK_END) == 0)
        size = ftell(f);
    if(size < 0 || fseek(f, 0, SEEK_SET) != 0)
    {
        fclose(f);
        return false;
    }
    size_t bytes = size;

    data.resize(bytes);
    if(fread(data.data(), 1, bytes, f) != bytes)
    {
        data.clear();
        fclose(f);
        return false;
    }
    fclose(f);

    return true;
}

bool read_text_file(const char* path, std::string& data)
{
    std::vector<uint8_t> bdata;
    if(!read_binary_file(path, bdata))
        return false;
    bdata.push_back(0);
    data = (const char*)bdata.data();
    return true;
}

void skip_whitespace(const char*& str)
{
    while(*str != 0 && strchr(" \t\r\n", *str)) str++;
}

void skip_spaces(const char*& str)
{
    while(*str != 0 && strchr(" =\t\r", *str)) str++;
}

// Skips whitespace along with whole '#' comment rows.
void skip_blank_rows(const char*& str)
{
    skip_whitespace(str);
    while(*str == '#')
    {
        while(*str != '\n' && *str) str++;
        skip_whitespace(str);
    }
}

bool is_number_start(char c)
{
    return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.';
}

bool read_double(const char*& str, double& d)
{
    char* out = nullptr;
    d = strtod(str, &out);
    if(out != str && (*out == 0 || strchr(" =\t\r\n", *out)))
    {
        str = out;
        return true;
    }
    else return false;
}

std::string read_string(const char*& str)
{
    std::string token;
    while(*str && strchr(" =\t\r\n", *str) == nullptr)
    {
        token += *str;
        str++;
    }
    return token;
}

using parameter = std::variant<std::string, double>;

int get_params(const parameter*, size_t param_count)
{
    if(param_count != 0)
        return 1; // Argument count mismatch
    return 0;
}

template<typename U, typename... T>
int get_params(const parameter* parameters, size_t param_count, U& first, T&... rest)
{
    if(param_count == 0)
        return 1; // Argument count mismatch.

    if constexpr(std::is_same_v<U, double>)
    {
        if(const double* val = std::get_if<double>(parameters))
            first = *val;
        else return 2; // Argument type mismatch.
    }
    else if constexpr(std::is_same_v<U, std::string>)
    {
        if(const std::string* val = std::get_if<std::string>(parameters))
            first = *val;
        else return 2; // Argument type mismatch.
    }
    else if constexpr(std::is_same_v<U, std::vector<std::string>>)
    {
        for(size_t i = 0; i < param_count; ++i)
        {
            if(const std::string* val = std::get_if<std::string>(parameters+i))
                first.push_back(*val);
            else return 2; // Argument type mismatch.
        }
        return get_params(nullptr, 0, rest...);
    }
    else if constexpr(std::is_same_v<U, parameter>)
    {
        first = *parameters;
    }

    return get_params(parameters+1, param_count-1, rest...);
}

template<typename... T>
int va_sizeof(T&... rest) {return sizeof...(rest);}

#define PARAMS(...) \
    { \
        int ret = get_params(parameters.data(), parameters.size(), __VA_ARGS__);\
        if(ret == 1)\
        {\
            fprintf(stderr, "Argument count mismatch: expected %d, got %zu\n", va_sizeof(__VA_ARGS__), parameters.size());\
            return false; \
        }\
        else if(ret == 2)\
        {\
            fprintf(stderr, "Argument type mismatch\n"); \
            return false; \
        }\
    }\

using command_handler = std::function<bool(context&, const std::vector<parameter>& parameters)>;

const complete_number* find_value(const context& ctx, const std::string& name)
{
    auto it = ctx.values.find(name);
    if(it == ctx.values.end())
    {
        fprintf(stderr, "No such number: %s\n", name.c_str());
        return nullptr;
    }
    return &it->second;
}

bool store_value(
    context& ctx,
    const std::string& name,
    const std::optional<complete_number>& value
){
    if(!value.has_value())
        return false;
    ctx.values.insert_or_assign(name, *value);
    return true;
}

// Shared shape of 'add', 'sub' and the two-number 'mul'.
bool binary_command(
    context& ctx,
    const std::vector<parameter>& parameters,
    const std::function<std::optional<complete_number>(
        const complete_number&, const complete_number&)>& op
){
    std::string dst, a_name, b_name;
    PARAMS(dst, a_name, b_name);

    const complete_number* a = find_value(ctx, a_name);
    const complete_number* b = find_value(ctx, b_name);
    if(!a || !b)
        return false;
    return store_value(ctx, dst, op(*a, *b));
}

// Shared shape of the commands that take a literal real factor.
bool scalar_command(
    context& ctx,
    const std::vector<parameter>& parameters,
    const std::function<std::optional<complete_number>(
        const complete_number&, double)>& op
){
    std::string dst, a_name;
    double factor = 0;
    PARAMS(dst, a_name, factor);

    const complete_number* a = find_value(ctx, a_name);
    if(!a)
        return false;
    return store_value(ctx, dst, op(*a, factor));
}

bool unary_command(
    context& ctx,
    const std::vector<parameter>& parameters,
    const std::function<complete_number(const complete_number&)>& op
){
    std::string dst, a_name;
    PARAMS(dst, a_name);

    const complete_number* a = find_value(ctx, a_name);
    if(!a)
        return false;
    return store_value(ctx, dst, op(*a));
}

const std::unordered_map<std::string, command_handler> command_handlers = {
    {"real", [](context& ctx, const std::vector<parameter>& parameters)->bool
    {
        std::string name;
        double real = 0;
        double vanished = 0;
        if(parameters.size() == 2) PARAMS(name, real)
        else PARAMS(name, real, vanished)

        return store_value(ctx, name, complete_number(real, vanished));
    }},
    {"complex", [](context& ctx, const std::vector<parameter>& parameters)->bool
    {
        std::string name;
        double re = 0, im = 0;
        double vanished_re = 0, vanished_im = 0;
        if(parameters.size() == 3) PARAMS(name, re, im)
        else PARAMS(name, re, im, vanished_re, vanished_im)

        return store_value(ctx, name, complete_number(
            std::complex<double>(re, im),
            std::complex<double>(vanished_re, vanished_im)
        ));
    }},
    {"add", [](context& ctx, const std::vector<parameter>& parameters)->bool
    {
        return binary_command(ctx, parameters, sum);
    }},
    {"sub", [](context& ctx, const std::vector<parameter>& parameters)->bool
    {
        return binary_command(ctx, parameters, difference);
    }},
    {"mul", [](context& ctx, const std::vector<parameter>& parameters)->bool
    {
        if(parameters.size() == 3 && std::holds_alternative<double>(parameters[2]))
        {
            return scalar_command(ctx, parameters,
                [](const complete_number& a, double factor)
                -> std::optional<complete_number> { return scale(a, factor); }
            );
        }
        return binary_command(ctx, parameters,
            [](const complete_number& a, const complete_number& b)
            { return multiply(a, b); }
        );
    }},
    {"div", [](context& ctx, const std::vector<parameter>& parameters)->bool
    {
        return scalar_command(ctx, parameters, divide);
    }},
    {"absorb-real", [](context& ctx, const std::vector<parameter>& parameters)->bool
    {
        return scalar_command(ctx, parameters,
            [](const complete_number& a, double factor)
            -> std::optional<complete_number> { return scale_real_axis(a, factor); }
        );
    }},
    {"absorb-imag", [](context& ctx, const std::vector<parameter>& parameters)->bool
    {
        return scalar_command(ctx, parameters,
            [](const complete_number& a, double factor)
            -> std::optional<complete_number> { return scale_imag_axis(a, factor); }
        );
    }},
    {"neg", [](context& ctx, const std::vector<parameter>& parameters)->bool
    {
        return unary_command(ctx, parameters, negate);
    }},
    {"lift", [](context& ctx, const std::vector<parameter>& parameters)->bool
    {
        return unary_command(ctx, parameters, lift);
    }},
    {"print", [](context& ctx, const std::vector<parameter>& parameters)->bool
    {
        std::vector<std::string> names;
        PARAMS(names);
        for(const std::string& name: names)
        {
            const complete_number* value = find_value(ctx, name);
            if(!value)
                return false;
            printf("%s = %s\n", name.c_str(), to_string(*value).c_str());
        }
        return true;
    }},
    {"standard", [](context& ctx, const std::vector<parameter>& parameters)->bool
    {
        std::string name;
        PARAMS(name);
        const complete_number* value = find_value(ctx, name);
        if(!value)
            return false;
        printf("standard(%s) = %s\n", name.c_str(), to_string(value->to_standard()).c_str());
        return true;
    }},
    {"vanished", [](context& ctx, const std::vector<parameter>& parameters)->bool
    {
        std::string name;
        PARAMS(name);
        const complete_number* value = find_value(ctx, name);
        if(!value)
            return false;
        printf("vanished(%s) = %s\n", name.c_str(), to_string(value->vanished_component()).c_str());
        return true;
    }},
    {"expect", [](context& ctx, const std::vector<parameter>& parameters)->bool
    {
        std::string a_name, b_name;
        PARAMS(a_name, b_name);
        const complete_number* a = find_value(ctx, a_name);
        const complete_number* b = find_value(ctx, b_name);
        if(!a || !b)
            return false;
        if(*a != *b)
        {
            fprintf(
                stderr, "Expected %s == %s, but %s != %s\n",
                a_name.c_str(), b_name.c_str(),
                to_string(*a).c_str(), to_string(*b).c_str()
            );
            return false;
        }
        return true;
    }}
};

int main(int argc, char** argv)
{
    if(argc != 2 || strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0)
    {
        fprintf(stderr, "Usage: %s <path-to-command-list>\n%s", argv[0], command_list_format);
        return 1;
    }

    context ctx;

    std::string src_str;
    bool success = read_text_file(argv[1], src_str);
    if(!success)
    {
        fprintf(stderr, "Failed to open %s\n", argv[1]);
        return 2;
    }
    const char* command_list = src_str.c_str();
    skip_blank_rows(command_list);
    while(*command_list)
    {
        std::string command_name = read_string(command_list);
        if(command_handlers.count(command_name) == 0)
        {
            fprintf(stderr, "No such command: %s\n", command_name.c_str());
            return 3;
        }

        skip_spaces(command_list);
        // Read parameters.
        std::vector<parameter> parameters;
        while(*command_list && *command_list != '\n')
        {
            if(is_number_start(*command_list))
            {
                double d;
                if(!read_double(command_list, d))
                {
                    fprintf(stderr, "Failed to parse number: %s\n", read_string(command_list).c_str());
                    return 3;
                }
                else parameters.push_back(d);
            }
            else
            {
                std::string token = read_string(command_list);
                parameters.push_back(token);
            }
            skip_spaces(command_list);
        }

        auto it = command_handlers.find(command_name);
        if(!it->second(ctx, parameters))
        {
            fprintf(stderr, "Command \"%s\" failed, exiting.\n", command_name.c_str());
            return 4;
        }
        skip_blank_rows(command_list);
    }
    return 0;
}
