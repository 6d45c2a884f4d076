/* weft: render one template out of a directory of QWeb templates.

    weft <template-dir> <template-ref> [-o file] [-c name value]... [-l lang] [-b] [-d] [-w]

    Every *.xml file under the template directory is loaded; templates are found by t-name (or by the numeric id the loader gave
    them). -c binds a string value for the render, -l sets the language, -b turns branding on, -d turns dev mode on (t-debug works,
    deprecated directives are reported). With -w, weft stays around and renders again whenever something in the directory changes.
*/

#include <defs.h>
#include <engine.hpp>
#include <fileman.hpp>
#include <treewatcher.hpp>
#include <errors.hpp>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <string>
#include <vector>


struct ConfigEntry {
    std::string name;
    std::string content;
};


bool renderTemplate(Engine& engine, const std::string& ref, const Mapping& values, const RenderOptions& options, const std::string& outputFile) {
    try {
        if (outputFile.size() == 0) {
            FileWriteOutput out(1);
            engine.render(ref, values, options, out);
            out.write("\n");
        }
        else {
            printf(INFO "Rendering %s to %s.\n", ref.c_str(), outputFile.c_str());
            std::string rendered = engine.render(ref, values, options); // nothing gets written over if the render fails
            FileMan files("");
            FileWriteOutput out = files.create(outputFile);
            if (!out.isValid()) {
                return false;
            }
            out.write(rendered);
        }
    }
    catch (TemplateError& e) {
        printf(ERROR "%s\n", e.describe().c_str());
        return false;
    }
    catch (StorageConflictError& e) {
        printf(ERROR "Storage conflict: %s\n", e.what());
        return false;
    }
    return true;
}


int main(int argc, char** argv) {
    printf("\033[1mweft v1.0\033[0m\n");
    std::string templateDir;
    std::string ref;
    std::string outputFile;
    std::vector<ConfigEntry> config;
    RenderOptions options;
    bool watchdog = false;
    for (int i = 1; i < argc; i ++) {
        if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            i ++;
            outputFile = argv[i];
        }
        else if (strcmp(argv[i], "-c") == 0 && i + 2 < argc) {
            config.push_back(ConfigEntry{ argv[i + 1], argv[i + 2] });
            i += 2;
        }
        else if (strcmp(argv[i], "-l") == 0 && i + 1 < argc) {
            i ++;
            options.lang = argv[i];
        }
        else if (strcmp(argv[i], "-b") == 0) {
            options.inheritBranding = true;
        }
        else if (strcmp(argv[i], "-d") == 0) {
            options.devMode = true;
        }
        else if (strcmp(argv[i], "-w") == 0) {
            watchdog = true;
        }
        else if (templateDir.size() == 0) {
            templateDir = argv[i];
        }
        else if (ref.size() == 0) {
            ref = argv[i];
        }
        else {
            printf(ERROR "Unexpected argument %s\n", argv[i]);
        }
    }
    if (templateDir.size() == 0 || ref.size() == 0) {
        printf("Usage: weft <template-dir> <template-ref> [-o file] [-c name value]... [-l lang] [-b] [-d] [-w]\n");
        return 1;
    }

    Mapping values;
    for (ConfigEntry& conf : config) {
        values.set(conf.name, Value::str(conf.content));
    }

    DirectoryLoader loader(templateDir);
    Engine engine;
    engine.setLoader(&loader);
    bool ok = renderTemplate(engine, ref, values, options, outputFile);

    if (watchdog) {
        TreeWatcher watcher;
        loader.files.walk([&](std::string path) {
            watcher.filewatch(path);
        }, [&](std::string path) {
            watcher.dirwatch(path);
        });
        printf("\033[1;33mInitial render complete!\033[0m\n");
        printf(WATCHDOG "weft will now idle (it will not consume CPU) until a template changes, and will then render again.\n");
        while (true) {
            bool changed = false;
            watcher.waitForModifications([&](std::string name) {
                printf(WATCHDOG "%s was modified.\n", name.c_str());
                changed = true;
            }, [&](std::string name) {
                printf(WATCHDOG "%s was deleted.\n", name.c_str());
                changed = true;
            });
            if (changed) {
                loader.reload();
                engine.clearCache();
                renderTemplate(engine, ref, values, options, outputFile);
            }
        }
    }
    printf(ok ? "\033[1;33mRender complete!\033[0m\n" : "\033[1;31mRender failed.\033[0m\n");
    return ok ? 0 : 1;
}
