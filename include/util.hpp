#pragma once
#include <string>
#include <vector>
#include <cstring>
#include <cstdint>
#include <sys/stat.h>
#include <defs.h>


void mkdirR(std::string filename);

bool isWhitespace(char thing);

bool isBlank(const std::string& thing); // python's str.isspace: true only for a non-empty, all-whitespace string

bool isNumber(const std::string& data); // every byte is a digit (and there is at least one)

bool toInteger(const std::string& digits, int64_t& out); // decimal digits to an int64; false when it does not fit

bool isVarname(const std::string& name); // [A-Za-z_][A-Za-z0-9_]*

std::string toVarname(const std::string& name); // collapse every run of non-identifier bytes into a single _

bool startsWith(const std::string& thing, const std::string& prefix);

bool endsWith(const std::string& thing, const std::string& suffix);

std::string stripWhitespace(const std::string& thing);

std::vector<std::string> splitOn(const std::string& thing, char sep);

std::string toLower(std::string thing);

std::string escapeHtml(const std::string& thing); // markup escape: & < > " ' all get entities

std::string escapeText(const std::string& thing); // xml text escape: & < > only

bool isMaliciousUrl(const std::string& url); // javascript: anywhere in the value, unless it is a bare history.back()

std::string quotePlus(const std::string& thing, const std::string& safe = ""); // form-encode: space is +, the rest %XX

bool isUrlAttribute(const std::string& name); // href, src, action, formaction, xlink:href

bool isVoidElement(const std::string& tag); // <br/> and friends: no content, no closing tag

// whitespace handling around compiled text (the regexes the template dialect was designed around)
std::string rstripNewline(std::string& text); // strip a trailing "\n[ \t]*" off text, returning what was stripped

bool lstripNewline(const std::string& text); // does the text start with "[ \t]*\n"?

std::string collapseFirstNewlines(const std::string& text); // "^(\n[ \t]*)+(\n[ \t])" -> the last group

size_t utf8Length(const std::string& thing);

std::vector<std::string> utf8Split(const std::string& thing); // one string per code point

void appendUtf8(std::string& out, uint32_t codepoint);

std::string fconcat(std::string one, std::string two); // sanely glue two filenames together
