// synvm: command-line driver
// Usage: synvm [--restore <snapshot>] [--script <file>] [--save <snapshot>]
//              [--quiet] [--trace] <image>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "synvm/errors.hpp"
#include "synvm/panic.h"
#include "synvm/vm_api.h"

namespace
{

struct Options
{
  const char* image = nullptr;
  const char* restore = nullptr;
  const char* script = nullptr;
  const char* save = nullptr;
  bool quiet = false;
  bool trace = false;
};

void usage(const char* argv0)
{
  std::fprintf(stderr,
               "usage: %s [--restore <snapshot>] [--script <file>] [--save <snapshot>]\n"
               "          [--quiet] [--trace] <image>\n",
               argv0);
}

bool parse_args(int argc, char** argv, Options* opt)
{
  for (int i = 1; i < argc; ++i)
  {
    const char* arg = argv[i];
    bool has_value = i + 1 < argc;
    if (std::strcmp(arg, "--restore") == 0 && has_value)
      opt->restore = argv[++i];
    else if (std::strcmp(arg, "--script") == 0 && has_value)
      opt->script = argv[++i];
    else if (std::strcmp(arg, "--save") == 0 && has_value)
      opt->save = argv[++i];
    else if (std::strcmp(arg, "--quiet") == 0)
      opt->quiet = true;
    else if (std::strcmp(arg, "--trace") == 0)
      opt->trace = true;
    else if (arg[0] != '-' && !opt->image)
      opt->image = arg;
    else
      return false;
  }
  // An image is only optional when resuming from a snapshot
  return opt->image || opt->restore;
}

// Copies a scripted transcript into the VM's input buffer
synvm_err feed_script(Vm* vm, const char* path)
{
  FILE* f = std::fopen(path, "rb");
  if (!f)
    return SYNVM_ERR(IoError);

  synvm_err err = SYNVM_ERR(OK);
  synvm_u8 chunk[4096];
  std::size_t got;
  while (!err && (got = std::fread(chunk, 1, sizeof(chunk), f)) > 0)
    err = vm_input_append(vm, chunk, got);
  if (!err && std::ferror(f))
    err = SYNVM_ERR(IoError);
  std::fclose(f);
  return err;
}

// Writes whatever the guest printed since the last flush
void drain_output(Vm* vm)
{
  synvm_u8 chunk[4096];
  int n;
  while ((n = vm_output_read(vm, chunk, static_cast<int>(sizeof(chunk)))) > 0)
    std::fwrite(chunk, 1, static_cast<std::size_t>(n), stdout);
  std::fflush(stdout);
}

void report(const char* what, const char* path, synvm_err err)
{
  std::fprintf(stderr, "synvm: %s '%s': %s\n", what, path, err_str(static_cast<Err>(err)));
}

synvm_err run_traced(Vm* vm)
{
  char text[64];
  synvm_err e;
  do
  {
    if (vm_disasm(vm, vm_get_pc(vm), text, sizeof(text)) > 0)
      std::fprintf(stderr, "%5u: %s\n", static_cast<unsigned>(vm_get_pc(vm)), text);
    e = vm_step(vm);
  } while (e == SYNVM_ERR(OK));

  if (e < 0)
    return vm_panic(vm, e);
  return e;
}

}  // namespace

int main(int argc, char** argv)
{
  Options opt;
  if (!parse_args(argc, argv, &opt))
  {
    usage(argv[0]);
    return 1;
  }

  // Scripted runs buffer both directions; interactive runs use the terminal
  VmConfig cfg{};
  if (opt.script)
  {
    cfg.input_kind = SYNVM_IO_BUFFER;
    cfg.output_kind = opt.quiet ? SYNVM_IO_DISCARD : SYNVM_IO_BUFFER;
  }
  else
  {
    cfg.input_kind = SYNVM_IO_TERMINAL;
    cfg.output_kind = SYNVM_IO_TERMINAL;
  }

  Vm* vm = vm_create(&cfg);
  if (!vm)
  {
    std::fprintf(stderr, "synvm: out of memory\n");
    return 1;
  }

  synvm_err err = opt.restore ? vm_snapshot_load_file(vm, opt.restore)
                              : vm_load_image_file(vm, opt.image);
  if (err)
  {
    report(opt.restore ? "cannot restore" : "cannot load", opt.restore ? opt.restore : opt.image,
           err);
    vm_destroy(vm);
    return 1;
  }

  if (opt.script && (err = feed_script(vm, opt.script)))
  {
    report("cannot read script", opt.script, err);
    vm_destroy(vm);
    return 1;
  }

  err = opt.trace ? run_traced(vm) : vm_run(vm);
  if (opt.script)
    drain_output(vm);

  if (opt.save)
  {
    synvm_err save_err = vm_snapshot_save_file(vm, opt.save);
    if (save_err)
      report("cannot save", opt.save, save_err);
    else
      std::fprintf(stderr, "synvm: snapshot saved to '%s' (pc=%u)\n", opt.save,
                   static_cast<unsigned>(vm_get_pc(vm)));
  }

  vm_destroy(vm);
  return err == SYNVM_ERR(Halt) ? 0 : 1;
}
