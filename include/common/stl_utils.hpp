#pragma once

#include <algorithm>
#include <string>
#include <vector>

template <typename ContainerT, typename T>
bool contains(const ContainerT &cont, const T &value) {
    return cont.find(value) != cont.end();
}

/**
 * @brief 取字符串中第一个分隔符之前的部分
 * 用于获取 "os.path" 这样的模块名的顶层包名 "os"
 */
template <typename StringT>
StringT substr_before_first(const StringT &str, char delim) {
    auto idx = str.find(delim);
    if (idx == StringT::npos)
        return str;
    else
        return str.substr(0, idx);
}

bool is_integer(const std::string &s);

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
