// Values of the template expression language. They follow python's data model closely enough that existing QWeb templates
// render the same: dynamic typing, truthiness, str() vs repr(), reference semantics for lists and dicts.
#pragma once
#include <defs.h>
#include <string>
#include <vector>
#include <memory>
#include <utility>
#include <cstdint>
#include <unordered_map>


typedef std::vector<Value> Sequence; // the storage behind lists and tuples
typedef std::vector<std::pair<std::string, Value>> Kwargs;


struct Callable { // builtins, lambdas and bound methods
    std::string name;

    virtual ~Callable() {}

    virtual Value call(std::vector<Value>& args, Kwargs& kwargs) = 0;
};


struct LazyContent { // a block of template that is only rendered when something needs it as text
    virtual ~LazyContent() {}

    virtual std::string html() = 0; // renders on first use, then memoized

    virtual std::string describe() const = 0;
};


struct Value {
    enum Kind {
        None,
        Bool,
        Int,
        Float,
        Str,
        Markup, // text that is already safe to output as-is
        List,
        Tuple,
        Dict,
        Function,
        Content
    } kind = None;

    bool b = false;
    int64_t i = 0;
    double f = 0;
    std::string s; // Str and Markup
    std::shared_ptr<Sequence> seq; // List and Tuple; lists are shared by reference, like python's
    std::shared_ptr<Mapping> map; // Dict
    std::shared_ptr<Callable> fn; // Function
    std::shared_ptr<LazyContent> content; // Content

    static Value none();

    static Value boolean(bool v);

    static Value integer(int64_t v);

    static Value number(double v);

    static Value str(std::string v);

    static Value markup(std::string v);

    static Value list(Sequence items = {});

    static Value tuple(Sequence items = {});

    static Value dict();

    static Value dict(const Mapping& m); // copies m

    static Value function(std::shared_ptr<Callable> f);

    static Value lazy(std::shared_ptr<LazyContent> c);

    bool truthy() const; // forces Content!

    bool isNone() const { return kind == None; }

    bool isText() const; // Str, Markup or Content: anything that behaves as a str

    bool isSafe() const; // Markup or Content

    bool isNumeric() const; // Bool, Int or Float

    bool isSequence() const; // List or Tuple

    double asDouble() const;

    std::string toString() const; // str()

    std::string repr() const; // repr()

    std::string typeName() const; // type(x).__name__

    std::string escaped() const; // the text as it goes into markup: safe values untouched, everything else html-escaped

    bool equals(const Value& other) const; // ==
};


struct Mapping { // an insertion-ordered dict with string keys
    std::vector<std::pair<std::string, Value>> items;
    std::unordered_map<std::string, size_t> index;

    Mapping() {}

    Mapping(std::initializer_list<std::pair<std::string, Value>> init);

    Value* find(const std::string& key);

    const Value* find(const std::string& key) const;

    bool contains(const std::string& key) const;

    Value get(const std::string& key) const; // None if absent

    void set(const std::string& key, Value value);

    void setdefault(const std::string& key, Value value);

    bool erase(const std::string& key);

    void update(const Mapping& other);

    size_t size() const { return items.size(); }
};


std::string floatRepr(double d); // python's shortest round-trip repr of a float

std::string keyOf(const Value& key); // dict keys are strings: other values are stored under their str()
