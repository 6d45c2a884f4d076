#pragma once
#include <vector>
#include <string>

#define INFO      "\033[32m[   INFO   ]\033[0m "
#define ERROR     "\033[1;31m[   ERROR  ]\033[0m "
#define WARNING   "\033[33m[  WARNING ]\033[0m "
#define WATCHDOG  "\033[34m[ WATCHDOG ]\033[0m "
#define PROFILE   "\033[35m[  PROFILE ]\033[0m "

#define WEFT_MAX_STACK_DEPTH 50 // frames; one more and the render dies with a RecursionError
#define WEFT_MAX_REPEAT (64u * 1024 * 1024) // items or bytes a single sequence repetition may produce
#define WEFT_CALL_SLOT "0" // binding that carries the caller's t-call body into the callee


struct Value; // forward-declarations for everything. this is useful because it means we don't have to import those files, decreasing the dependency web
struct Mapping; // (which makes builds faster)
class MapView;
struct WriteOutput;
struct XmlNode;
struct XmlElement;
struct Expression;
struct FormatString;
struct Instruction;
struct BlockRunner;
struct CompiledTemplate;
struct CallParameters;
struct ContentValue;
struct RenderOptions;
struct Session;
struct Engine;

typedef std::vector<Instruction*> Code; // a compiled block body. Whoever holds a Code owns the instructions in it.
