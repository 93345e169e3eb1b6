#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <unicode/umachine.h>

/**
 * @file Utf8.h
 * @brief UTF-8 与码点序列互转，以及基于 ICU 的字符分类与大小写映射。
 */

/**
 * @brief 一个文本单元。
 *
 * 非负值为 Unicode 码点；负值 -1 - b 表示无法解码的原始字节 b，
 * 编码时原样写回，保证任意字节串都能无损往返。
 */
using CodePoint = UChar32;
using CodePoints = std::vector<CodePoint>;

/** @brief 解码 UTF-8；非法序列逐字节保留为原始字节单元。 */
CodePoints decodeUtf8(std::string_view text);

/** @brief 编码回 UTF-8，原始字节单元按原值输出。 */
std::string encodeUtf8(const CodePoints& units);

/** @brief 是否为原始字节单元（非码点）。 */
inline bool isRawByte(CodePoint c) { return c < 0; }

/// Unicode 通用类别 L（Lu/Ll/Lt/Lm/Lo）。未分配码点与原始字节均不是字母。
bool isLetter(CodePoint c);

/// Unicode White_Space 属性，外加 U+FEFF。
bool isWhitespace(CodePoint c);

/**
 * @brief 字符是否等于自身的完整大写映射。
 *
 * 无大小写的字符（撇号、数字、连字符、未分配码点、原始字节）也返回 true；
 * ß 的完整大写为 "SS"，因此返回 false。打乱时据此按位置恢复大写。
 */
bool isUpperCase(CodePoint c);

/// 一对一的简单大小写映射，长度不变；原始字节单元原样返回。
CodePoint toLowerCase(CodePoint c);
CodePoint toUpperCase(CodePoint c);
