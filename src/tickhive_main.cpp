#include "scheduler.h"
#include "system_jobs.h"
#include "tickhive_config.h"
#include "Logger.hpp"

#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    std::string config_path = "../config/tickhive_config.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    tickhive::TickHiveConfig* config = nullptr;
    try {
        config = tickhive::TickHiveConfig::GetInstance(config_path);
        config->apply_log_config();
    } catch (const std::exception& e) {
        std::cerr << "加载配置失败: " << e.what() << std::endl;
        return 1;
    }
    config->print();

    try {
        auto store = std::make_shared<tickhive::SystemInfoStore>();
        tickhive::Scheduler scheduler;

        const tickhive::JobConfig& sys_conf = config->get_system_info_config();
        if (sys_conf.enabled) {
            scheduler.spawn<tickhive::SystemInfoJob>(sys_conf, store);
        }
        const tickhive::JobConfig& hb_conf = config->get_heartbeat_config();
        if (hb_conf.enabled) {
            scheduler.spawn<tickhive::HeartbeatJob>(hb_conf, store);
        }

        TICKHIVE_LOG_INFO("tickhive 已启动，%zu 个任务运行中，Ctrl+C 退出", scheduler.running());
        // 收到 SIGINT/SIGTERM 后停止所有任务
        scheduler.wait();
    } catch (const std::exception& e) {
        TICKHIVE_LOG_FATAL("tickhive 异常退出: %s", e.what());
        return 1;
    }
    return 0;
}
