#include <dsm/template/builtin_templates.h>

#include <map>

namespace dsm::templating {

namespace {

constexpr std::string_view kApache24Conf = R"(# Apache 2.4 configuration of site ***SITE***
ServerRoot "***SERVERROOT***"
ServerName ***SERVERNAME***
Listen 127.0.0.1:***HTTP_PORT***
PidFile "***PIDPATH***"
Mutex file:***LOCKDIR*** default

LoadModule mpm_prefork_module ***MODULEDIR***/mod_mpm_prefork.so
LoadModule authz_core_module ***MODULEDIR***/mod_authz_core.so
LoadModule dir_module ***MODULEDIR***/mod_dir.so
LoadModule mime_module ***MODULEDIR***/mod_mime.so
LoadModule log_config_module ***MODULEDIR***/mod_log_config.so
LoadModule rewrite_module ***MODULEDIR***/mod_rewrite.so

User ***USER***
Group ***GROUP***

ErrorLog "***LOGDIR***/***ERRLOGFILE***"
LogFormat "%h %l %u %t \"%r\" %>s %b" common
CustomLog "***LOGDIR***/***ACCLOGFILE***" common

TypesConfig /etc/mime.types
DocumentRoot "***DOCDIR***"
DirectoryIndex index.html index.php

<Directory />
    AllowOverride None
    Require all denied
</Directory>

<Directory "***DOCDIR***">
    Options FollowSymLinks
    AllowOverride All
    Require all granted
</Directory>
)";

constexpr std::string_view kApache22Conf = R"(# Apache 2.2 configuration of site ***SITE***
ServerRoot "***SERVERROOT***"
ServerName ***SERVERNAME***
Listen 127.0.0.1:***HTTP_PORT***
PidFile "***PIDPATH***"
LockFile "***LOCKDIR***/***LOCKFILE***"

LoadModule authz_host_module ***MODULEDIR***/mod_authz_host.so
LoadModule dir_module ***MODULEDIR***/mod_dir.so
LoadModule mime_module ***MODULEDIR***/mod_mime.so
LoadModule log_config_module ***MODULEDIR***/mod_log_config.so
LoadModule rewrite_module ***MODULEDIR***/mod_rewrite.so

User ***USER***
Group ***GROUP***

ErrorLog "***LOGDIR***/***ERRLOGFILE***"
LogFormat "%h %l %u %t \"%r\" %>s %b" common
CustomLog "***LOGDIR***/***ACCLOGFILE***" common

TypesConfig /etc/mime.types
DocumentRoot "***DOCDIR***"
DirectoryIndex index.html index.php

<Directory "***DOCDIR***">
    Options FollowSymLinks
    AllowOverride All
    Order allow,deny
    Allow from all
</Directory>
)";

constexpr std::string_view kApacheStart = R"(#!/bin/sh
# Start the Apache2 server of site ***SITE***
exec '***CONTROLLER***' start --pid-file '***PIDPATH***' --log-file '***LOGDIR***/apache2_console.log' --timeout ***START_TIMEOUT*** -- '***DAEMON***' -f '***CONFPATH***' -DFOREGROUND
)";

constexpr std::string_view kApacheStop = R"(#!/bin/sh
# Stop the Apache2 server of site ***SITE***
exec '***CONTROLLER***' stop --pid-file '***PIDPATH***' --timeout ***STOP_TIMEOUT***
)";

constexpr std::string_view kApacheIsRunning = R"(#!/bin/sh
exec '***CONTROLLER***' status --pid-file '***PIDPATH***'
)";

constexpr std::string_view kMysqlConf = R"(# MySQL configuration of site ***SITE***
[client]
port = ***PORT***
socket = ***SOCKPATH***

[mysqld]
user = ***USER***
port = ***PORT***
bind-address = 127.0.0.1
socket = ***SOCKPATH***
pid-file = ***PIDPATH***
datadir = ***DATADIR***
tmpdir = ***RUNDIR***
log-error = ***LOGPATH***
server-id = ***ID***
)";

constexpr std::string_view kMysqlStart = R"(#!/bin/sh
# Start the MySQL server of site ***SITE***
exec '***CONTROLLER***' start --pid-file '***PIDPATH***' --log-file '***LOGDIR***/mysql_console.log' --timeout ***START_TIMEOUT*** -- '***DAEMON***' --defaults-file='***CONFPATH***'
)";

constexpr std::string_view kMysqlStop = R"(#!/bin/sh
# Stop the MySQL server of site ***SITE***
exec '***CONTROLLER***' stop --pid-file '***PIDPATH***' --timeout ***STOP_TIMEOUT***
)";

constexpr std::string_view kMysqlIsRunning = R"(#!/bin/sh
exec '***CONTROLLER***' status --pid-file '***PIDPATH***'
)";

constexpr std::string_view kMysqlCreate = R"(CREATE DATABASE IF NOT EXISTS `***DATABASE***`;
CREATE USER IF NOT EXISTS '***DBUSER***'@'127.0.0.1' IDENTIFIED BY '***PASSWORD***';
CREATE USER IF NOT EXISTS '***DBUSER***'@'localhost' IDENTIFIED BY '***PASSWORD***';
GRANT ALL ON `***DATABASE***`.* TO '***DBUSER***'@'127.0.0.1';
GRANT ALL ON `***DATABASE***`.* TO '***DBUSER***'@'localhost';
FLUSH PRIVILEGES;
)";

constexpr std::string_view kPgsqlConf = R"(# PostgreSQL configuration of site ***SITE***
listen_addresses = '127.0.0.1'
port = ***PORT***
unix_socket_directories = '***RUNDIR***'
external_pid_file = '***PIDPATH***'
hba_file = '***DATADIR***/pg_hba.conf'
ident_file = '***DATADIR***/pg_ident.conf'
logging_collector = off
)";

constexpr std::string_view kPgsqlHba = R"(# TYPE  DATABASE  USER  ADDRESS       METHOD
local   all       ***USER***                trust
local   all       all                       md5
host    all       all   127.0.0.1/32        md5
)";

constexpr std::string_view kPgsqlIdent = R"(# MAPNAME  SYSTEM-USERNAME  PG-USERNAME
)";

constexpr std::string_view kPgsqlStart = R"(#!/bin/sh
# Start the PostgreSQL server of site ***SITE***
exec '***CONTROLLER***' start --pid-file '***PIDPATH***' --log-file '***LOGPATH***' --timeout ***START_TIMEOUT*** -- '***DAEMON***' -D '***DATADIR***'
)";

constexpr std::string_view kPgsqlStop = R"(#!/bin/sh
# Stop the PostgreSQL server of site ***SITE*** (fast shutdown)
exec '***CONTROLLER***' stop --pid-file '***PIDPATH***' --signal INT --timeout ***STOP_TIMEOUT***
)";

constexpr std::string_view kPgsqlIsRunning = R"(#!/bin/sh
exec '***CONTROLLER***' status --pid-file '***PIDPATH***'
)";

constexpr std::string_view kPgsqlCreate = R"(CREATE ROLE "***DBUSER***" LOGIN PASSWORD '***PASSWORD***';
CREATE DATABASE "***DATABASE***" OWNER "***DBUSER***";
)";

const std::map<std::string, std::string_view>& registry() {
    static const std::map<std::string, std::string_view> templates = {
        {"apache2/2.2.conf", kApache22Conf},
        {"apache2/2.4.conf", kApache24Conf},
        {"apache2/start", kApacheStart},
        {"apache2/stop", kApacheStop},
        {"apache2/isrunning", kApacheIsRunning},
        {"mysql/conf", kMysqlConf},
        {"mysql/start", kMysqlStart},
        {"mysql/stop", kMysqlStop},
        {"mysql/isrunning", kMysqlIsRunning},
        {"mysql/create", kMysqlCreate},
        {"pgsql/conf", kPgsqlConf},
        {"pgsql/pg_hba.conf", kPgsqlHba},
        {"pgsql/pg_ident.conf", kPgsqlIdent},
        {"pgsql/start", kPgsqlStart},
        {"pgsql/stop", kPgsqlStop},
        {"pgsql/isrunning", kPgsqlIsRunning},
        {"pgsql/create", kPgsqlCreate},
    };
    return templates;
}

} // namespace

std::optional<std::string_view> findBuiltinTemplate(const std::string& name) {
    const auto& templates = registry();
    auto it = templates.find(name);
    if (it == templates.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> builtinTemplateNames() {
    std::vector<std::string> names;
    for (const auto& [name, text] : registry()) {
        names.push_back(name);
    }
    return names;
}

} // namespace dsm::templating
