// zlang front end: interactive loop and script runner over the lexer/parser
#include <zlang/lex/lexer.hpp>
#include <zlang/parse/ast.hpp>
#include <zlang/parse/parser.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

struct ReplConfig {
    std::string prompt = "zlang>>> ";
    bool color = true;
    bool debug = false; // also print the structural dump
};
static ReplConfig g_cfg;

static std::string getenv_or(const char* k, const std::string& def="") { const char* v = std::getenv(k); return v?std::string(v):def; }
static bool truthy(const std::string& v) { return v=="1"||v=="true"||v=="on"; }
static std::string apply_color(const std::string& s, const char* code){ if(!g_cfg.color) return s; return std::string("\x1b[")+code+"m"+s+"\x1b[0m"; }

static void load_config(){
    std::string home=getenv_or("HOME"); if(home.empty()) return;
    std::ifstream in(home+"/.zlangrc"); if(!in) return;
    std::string line;
    while(std::getline(in,line)){
        if(line.empty()||line[0]=='#') continue;
        auto eq=line.find('='); if(eq==std::string::npos) continue;
        auto key=line.substr(0,eq); auto val=line.substr(eq+1);
        if(key=="prompt") g_cfg.prompt=val;
        else if(key=="color") g_cfg.color=truthy(val);
        else if(key=="debug") g_cfg.debug=truthy(val);
        else std::cerr << "[config] unknown key '" << key << "' ignored\n";
    }
}

static void debug_log(const std::string& msg){ if(g_cfg.debug) std::cerr << "[DEBUG] " << msg << "\n"; }

static void report(const zlang::Error& err){ std::cerr << apply_color(zlang::to_string(err),"31") << "\n"; }

static bool print_tokens(const std::string& src){
    zlang::Lexer lexer(src);
    auto ts = lexer.run();
    if(!ts){ report(ts.error()); return false; }
    for(auto &t : ts.value()) std::cout << zlang::describe(t) << "\n";
    debug_log("scanned " + std::to_string(ts.value().size()) + " tokens");
    return true;
}

static bool print_program(const std::string& src){
    auto program = zlang::parse_source(src);
    if(!program){ report(program.error()); return false; }
    for(auto &stmt : program.value().statements) std::cout << zlang::to_string(stmt) << "\n";
    debug_log(zlang::dump(program.value()));
    return true;
}

static void print_help(){
    std::cout << "Type 'exit()' to exit the program.\n";
    std::cout << "Type 'help()' for help.\n";
    std::cout << "Lexer(<source>) prints tokens, Parser(<source>) or plain input prints statements.\n";
}

// Strips "Name(" ... ")" around a command argument.
static bool unwrap_call(const std::string& line, const std::string& name, std::string& inner){
    if(line.rfind(name+"(",0)!=0 || line.back()!=')') return false;
    inner = line.substr(name.size()+1, line.size()-name.size()-2);
    return true;
}

static int run_script(const std::string& path){
    std::ifstream in(path);
    if(!in){ std::cerr << "cannot open " << path << "\n"; return 1; }
    std::ostringstream oss; oss << in.rdbuf();
    debug_log("parsing " + path);
    return print_program(oss.str()) ? 0 : 1;
}

int main(int argc, char* argv[]){
    load_config();
    std::string script;
    for(int i=1;i<argc;++i){
        std::string a=argv[i];
        if(a=="--debug"||a=="-d") g_cfg.debug=true;
        else if(a=="--no-color") g_cfg.color=false;
        else script=a;
    }
    if(!script.empty()) return run_script(script);

    std::cout << "Welcome to " << apply_color("zlang","1;36") << " REPL.\n";
    print_help();
    std::cout << "\n";
    int last_status = 0;
    std::string line;
    while(true){
        std::cout << g_cfg.prompt << std::flush;
        if(!std::getline(std::cin,line)) break;
        auto notspace = [](unsigned char ch){ return !std::isspace(ch); };
        line.erase(line.begin(), std::find_if(line.begin(), line.end(), notspace));
        line.erase(std::find_if(line.rbegin(), line.rend(), notspace).base(), line.end());
        if(line.empty()) continue;
        if(line=="exit()"){ std::cout << "Good bye.\n"; break; }
        if(line=="help()"){ print_help(); continue; }
        std::string inner; bool ok;
        if(unwrap_call(line,"Lexer",inner)) ok = print_tokens(inner);
        else if(unwrap_call(line,"Parser",inner)) ok = print_program(inner);
        else ok = print_program(line);
        last_status = ok ? 0 : 1;
    }
    return last_status;
}
