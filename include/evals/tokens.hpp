// first stage of the expression compiler: python-style tokens, then the namespacing pass that decides, for every bare name,
// whether it's a local (lambda argument or comprehension target), something left alone (keyword, builtin, keyword argument,
// attribute) or a lookup into the render values. The pass also produces the equivalent python text, which is what error
// messages and the tests show.
#pragma once
#include <string>
#include <vector>


struct Token {
    enum Type {
        Name,
        Number,
        String,
        Op,
        Newline, // a line break inside brackets
        Comment
    } type;

    enum Lookup {
        Plain, // not a name, or not rewritten
        Local, // bound by a lambda or a comprehension: _arg_x__
        Verbatim, // keywords, builtins, keyword arguments, attribute names
        MustExist, // values['x']: KeyError when missing
        Get // values.get('x'): None when missing
    } lookup = Plain;

    std::string text;
    int row, col; // start
    int endRow, endCol;
};


std::vector<Token> tokenize(const std::string& expr); // tokens of "(" + expr + ")". throws CompileError

std::string rewrite(std::vector<Token>& tokens, bool raiseOnMissing); // sets every Name's lookup, returns the python text. throws CompileError
