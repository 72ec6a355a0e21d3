#include "Builtins.hpp"
#include "../shell/CommandRegistry.hpp"
#include "../shell/ICommand.hpp"

#include <memory>

namespace Builtins {
    std::unique_ptr<ICommand> make_pwd();
    std::unique_ptr<ICommand> make_cd();
    std::unique_ptr<ICommand> make_ls();
    std::unique_ptr<ICommand> make_mkdir();
    std::unique_ptr<ICommand> make_rmdir();
    std::unique_ptr<ICommand> make_rm();
    std::unique_ptr<ICommand> make_cp();
    std::unique_ptr<ICommand> make_mv();
    std::unique_ptr<ICommand> make_touch();
    std::unique_ptr<ICommand> make_ln();
    std::unique_ptr<ICommand> make_link();
    std::unique_ptr<ICommand> make_unlink();
    std::unique_ptr<ICommand> make_readlink();
    std::unique_ptr<ICommand> make_realpath();
    std::unique_ptr<ICommand> make_truncate();
    std::unique_ptr<ICommand> make_mktemp();
    std::unique_ptr<ICommand> make_split();
    std::unique_ptr<ICommand> make_csplit();
    std::unique_ptr<ICommand> make_chmod();
    std::unique_ptr<ICommand> make_chown();
    std::unique_ptr<ICommand> make_cat();
    std::unique_ptr<ICommand> make_echo();
    std::unique_ptr<ICommand> make_head();
    std::unique_ptr<ICommand> make_tail();
    std::unique_ptr<ICommand> make_wc();
    std::unique_ptr<ICommand> make_nl();
    std::unique_ptr<ICommand> make_tac();
    std::unique_ptr<ICommand> make_rev();
    std::unique_ptr<ICommand> make_stat();
    std::unique_ptr<ICommand> make_file();
    std::unique_ptr<ICommand> make_mime();
    std::unique_ptr<ICommand> make_du();
    std::unique_ptr<ICommand> make_df();
    std::unique_ptr<ICommand> make_basename();
    std::unique_ptr<ICommand> make_dirname();
    std::unique_ptr<ICommand> make_pathchk();
    std::unique_ptr<ICommand> make_find();
    std::unique_ptr<ICommand> make_grep();
    std::unique_ptr<ICommand> make_sort();
    std::unique_ptr<ICommand> make_uniq();
    std::unique_ptr<ICommand> make_shuf();
    std::unique_ptr<ICommand> make_comm();
    std::unique_ptr<ICommand> make_tsort();
    std::unique_ptr<ICommand> make_diff();
    std::unique_ptr<ICommand> make_cmp();
    std::unique_ptr<ICommand> make_patch();
    std::unique_ptr<ICommand> make_cut();
    std::unique_ptr<ICommand> make_paste();
    std::unique_ptr<ICommand> make_join();
    std::unique_ptr<ICommand> make_column();
    std::unique_ptr<ICommand> make_colrm();
    std::unique_ptr<ICommand> make_col();
    std::unique_ptr<ICommand> make_expand();
    std::unique_ptr<ICommand> make_unexpand();
    std::unique_ptr<ICommand> make_fold();
    std::unique_ptr<ICommand> make_tr();
    std::unique_ptr<ICommand> make_sed();
    std::unique_ptr<ICommand> make_awk();
    std::unique_ptr<ICommand> make_fmt();
    std::unique_ptr<ICommand> make_pr();
    std::unique_ptr<ICommand> make_ul();
    std::unique_ptr<ICommand> make_sum();
    std::unique_ptr<ICommand> make_cksum();
    std::unique_ptr<ICommand> make_md5sum();
    std::unique_ptr<ICommand> make_sha1sum();
    std::unique_ptr<ICommand> make_sha256sum();
    std::unique_ptr<ICommand> make_od();
    std::unique_ptr<ICommand> make_hexdump();
    std::unique_ptr<ICommand> make_strings();
    std::unique_ptr<ICommand> make_seq();
    std::unique_ptr<ICommand> make_factor();
    std::unique_ptr<ICommand> make_numfmt();
    std::unique_ptr<ICommand> make_expr();
    std::unique_ptr<ICommand> make_bc();
    std::unique_ptr<ICommand> make_printf();
    std::unique_ptr<ICommand> make_test();
    std::unique_ptr<ICommand> make_alias();
    std::unique_ptr<ICommand> make_unalias();
    std::unique_ptr<ICommand> make_export();
    std::unique_ptr<ICommand> make_env();
    std::unique_ptr<ICommand> make_history();
    std::unique_ptr<ICommand> make_help();
    std::unique_ptr<ICommand> make_man();
    std::unique_ptr<ICommand> make_which();
    std::unique_ptr<ICommand> make_whereis();
    std::unique_ptr<ICommand> make_clear();
    std::unique_ptr<ICommand> make_about();
    std::unique_ptr<ICommand> make_date();
    std::unique_ptr<ICommand> make_whoami();
    std::unique_ptr<ICommand> make_uname();
    std::unique_ptr<ICommand> make_uptime();
    std::unique_ptr<ICommand> make_ps();
    std::unique_ptr<ICommand> make_top();
    std::unique_ptr<ICommand> make_kill();
    std::unique_ptr<ICommand> make_cal();
    std::unique_ptr<ICommand> make_sleep();
    std::unique_ptr<ICommand> make_time();
    std::unique_ptr<ICommand> make_watch();
    std::unique_ptr<ICommand> make_yes();
}

namespace Builtins {
    void register_all(CommandRegistry& reg) {
        reg.add(make_pwd());
        reg.add(make_cd());
        reg.add(make_ls());
        reg.add(make_mkdir());
        reg.add(make_rmdir());
        reg.add(make_rm());
        reg.add(make_cp());
        reg.add(make_mv());
        reg.add(make_touch());
        reg.add(make_ln());
        reg.add(make_link());
        reg.add(make_unlink());
        reg.add(make_readlink());
        reg.add(make_realpath());
        reg.add(make_truncate());
        reg.add(make_mktemp());
        reg.add(make_split());
        reg.add(make_csplit());
        reg.add(make_chmod());
        reg.add(make_chown());
        reg.add(make_cat());
        reg.add(make_echo());
        reg.add(make_head());
        reg.add(make_tail());
        reg.add(make_wc());
        reg.add(make_nl());
        reg.add(make_tac());
        reg.add(make_rev());
        reg.add(make_stat());
        reg.add(make_file());
        reg.add(make_mime());
        reg.add(make_du());
        reg.add(make_df());
        reg.add(make_basename());
        reg.add(make_dirname());
        reg.add(make_pathchk());
        reg.add(make_find());
        reg.add(make_grep());
        reg.add(make_sort());
        reg.add(make_uniq());
        reg.add(make_shuf());
        reg.add(make_comm());
        reg.add(make_tsort());
        reg.add(make_diff());
        reg.add(make_cmp());
        reg.add(make_patch());
        reg.add(make_cut());
        reg.add(make_paste());
        reg.add(make_join());
        reg.add(make_column());
        reg.add(make_colrm());
        reg.add(make_col());
        reg.add(make_expand());
        reg.add(make_unexpand());
        reg.add(make_fold());
        reg.add(make_tr());
        reg.add(make_sed());
        reg.add(make_awk());
        reg.add(make_fmt());
        reg.add(make_pr());
        reg.add(make_ul());
        reg.add(make_sum());
        reg.add(make_cksum());
        reg.add(make_md5sum());
        reg.add(make_sha1sum());
        reg.add(make_sha256sum());
        reg.add(make_od());
        reg.add(make_hexdump());
        reg.add(make_strings());
        reg.add(make_seq());
        reg.add(make_factor());
        reg.add(make_numfmt());
        reg.add(make_expr());
        reg.add(make_bc());
        reg.add(make_printf());
        reg.add(make_test());
        reg.add(make_alias());
        reg.add(make_unalias());
        reg.add(make_export());
        reg.add(make_env());
        reg.add(make_history());
        reg.add(make_help());
        reg.add(make_man());
        reg.add(make_which());
        reg.add(make_whereis());
        reg.add(make_clear());
        reg.add(make_about());
        reg.add(make_date());
        reg.add(make_whoami());
        reg.add(make_uname());
        reg.add(make_uptime());
        reg.add(make_ps());
        reg.add(make_top());
        reg.add(make_kill());
        reg.add(make_cal());
        reg.add(make_sleep());
        reg.add(make_time());
        reg.add(make_watch());
        reg.add(make_yes());
    }
}
