#ifndef DATABASE_MANAGER_H
#define DATABASE_MANAGER_H

#include <sqlite3.h>
#include <string>
#include <mutex>

namespace db {

/**
 * @brief 数据库管理器 (单例)
 * 负责 SQLite 连接的生命周期管理。
 * 连接在多个线程间共享, 每条语句以及整个事务期间都持有 mutex()。
 */
class DatabaseManager {
public:
    static DatabaseManager& instance();

    ~DatabaseManager();

    // 打开数据库 (":memory:" 为内存库)
    bool open(const std::string& path);
    
    // 关闭数据库
    void close();

    // 执行无返回值的 SQL (建表、插入、更新等)
    bool execute(const std::string& sql);

    // 事务支持
    bool begin_transaction();
    bool commit_transaction();
    bool rollback_transaction();

    // 获取原始句柄 (供 DAO 使用)
    sqlite3* connection() const { return db_; }

    // 语句级互斥 (可重入, 事务内的 DAO 调用会再次加锁)
    std::recursive_mutex& mutex() { return mutex_; }

    // 检查是否已连接
    bool is_open() const { return db_ != nullptr; }

private:
    DatabaseManager();
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // 创建必要的表结构
    bool create_tables();

    sqlite3* db_ = nullptr;
    std::recursive_mutex mutex_;
};

/**
 * @brief RAII 事务
 * 构造时加锁并 BEGIN, 未 commit() 的事务在析构时回滚。
 */
class Transaction {
public:
    Transaction();
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    bool active() const { return active_; }
    bool commit();

private:
    std::unique_lock<std::recursive_mutex> lock_;
    bool active_ = false;
};

} // namespace db

#endif // DATABASE_MANAGER_H
