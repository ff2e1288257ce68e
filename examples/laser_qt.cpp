#include <QApplication>
#include <QWidget>
#include <QPushButton>
#include <QLabel>
#include <QLineEdit>
#include <QDoubleSpinBox>
#include <QComboBox>
#include <QTextEdit>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QScrollBar>
#include <QTimer>
#include <QDateTime>
#include <thread>
#include <atomic>
#include <mutex>
#include <queue>
#include <vector>
#include <functional>

#include "devices/ppcl_laser.hpp"
#include "transport/serial.hpp"
#include "common/protocol.hpp"

using namespace ppcl;

class LaserPanel : public QWidget
{
    Q_OBJECT

public:
    LaserPanel() : laser_(serial_)
    {
        setWindowTitle("PPCL55x Control");
        resize(520, 600);

        auto* layout = new QVBoxLayout(this);

        status_label_ = new QLabel("Status: Not connected");
        status_label_->setStyleSheet("font-weight: bold;");
        layout->addWidget(status_label_);

        auto* port_layout = new QHBoxLayout();
        port_edit_ = new QLineEdit(PpclLaser::DEFAULT_PORT);
        port_layout->addWidget(port_edit_);
        auto* btn_connect = new QPushButton("Connect");
        connect(btn_connect, &QPushButton::clicked, this, &LaserPanel::connectLaser);
        port_layout->addWidget(btn_connect);
        auto* btn_disconnect = new QPushButton("Disconnect");
        connect(btn_disconnect, &QPushButton::clicked, this, &LaserPanel::disconnectLaser);
        port_layout->addWidget(btn_disconnect);
        layout->addLayout(port_layout);

        const LaserConfig& cfg = laser_.config();

        auto* wl_layout = new QHBoxLayout();
        wavelength_spin_ = new QDoubleSpinBox();
        wavelength_spin_->setRange(cfg.min_wavelength_nm, cfg.max_wavelength_nm);
        wavelength_spin_->setDecimals(3);
        wavelength_spin_->setSuffix(" nm");
        wavelength_spin_->setValue(1550.0);
        wl_layout->addWidget(wavelength_spin_);
        auto* btn_wl = new QPushButton("Set Wavelength");
        connect(btn_wl, &QPushButton::clicked, this, &LaserPanel::setWavelength);
        wl_layout->addWidget(btn_wl);
        layout->addLayout(wl_layout);

        auto* pw_layout = new QHBoxLayout();
        power_spin_ = new QDoubleSpinBox();
        power_spin_->setRange(cfg.min_power_dbm, cfg.max_power_dbm);
        power_spin_->setDecimals(2);
        power_spin_->setSuffix(" dBm");
        power_spin_->setValue(10.0);
        pw_layout->addWidget(power_spin_);
        auto* btn_pw = new QPushButton("Set Power");
        connect(btn_pw, &QPushButton::clicked, this, &LaserPanel::setPower);
        pw_layout->addWidget(btn_pw);
        layout->addLayout(pw_layout);

        auto* mode_layout = new QHBoxLayout();
        mode_combo_ = new QComboBox();
        mode_combo_->addItem("Regular", static_cast<int>(Protocol::Mode::REGULAR));
        mode_combo_->addItem("No dither", static_cast<int>(Protocol::Mode::NO_DITHER));
        mode_combo_->addItem("Clean", static_cast<int>(Protocol::Mode::CLEAN));
        mode_layout->addWidget(mode_combo_);
        auto* btn_mode = new QPushButton("Set Mode");
        connect(btn_mode, &QPushButton::clicked, this, &LaserPanel::setMode);
        mode_layout->addWidget(btn_mode);
        layout->addLayout(mode_layout);

        auto* power_layout = new QHBoxLayout();
        auto* btn_on = new QPushButton("ON");
        connect(btn_on, &QPushButton::clicked, this, &LaserPanel::turnOn);
        power_layout->addWidget(btn_on);
        auto* btn_off = new QPushButton("OFF");
        connect(btn_off, &QPushButton::clicked, this, &LaserPanel::turnOff);
        power_layout->addWidget(btn_off);
        layout->addLayout(power_layout);

        layout->addWidget(new QLabel("Log:"));
        log_text_ = new QTextEdit();
        log_text_->setReadOnly(true);
        log_text_->setStyleSheet("font-family: monospace; font-size: 11px;");
        layout->addWidget(log_text_);

        auto* btn_clear = new QPushButton("Clear Log");
        connect(btn_clear, &QPushButton::clicked, log_text_, &QTextEdit::clear);
        layout->addWidget(btn_clear);

        laser_.set_log_callback([this](const std::string& msg) {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            log_queue_.push(QString::fromStdString(msg));
        });

        message_timer_ = new QTimer(this);
        connect(message_timer_, &QTimer::timeout, this, &LaserPanel::processMessages);
        message_timer_->start(50);
    }

    ~LaserPanel()
    {
        for (auto& t : workers_) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

private slots:
    void processMessages()
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        while (!log_queue_.empty()) {
            logMsg(log_queue_.front());
            log_queue_.pop();
        }
        while (!status_queue_.empty()) {
            status_label_->setText(status_queue_.front());
            status_queue_.pop();
        }
    }

    void connectLaser()
    {
        std::string port = port_edit_->text().toStdString();
        run("Connect", [this, port]() {
            auto r = laser_.connect(port, PpclLaser::DEFAULT_BAUD);
            if (!r.ok()) {
                return QString("Connect FAILED: %1").arg(error_name(r.error()));
            }
            return QString("Connected at %1 baud").arg(laser_.link_state().baud_rate);
        });
    }

    void disconnectLaser()
    {
        run("Disconnect", [this]() {
            auto r = laser_.disconnect();
            return r.ok() ? QString("Disconnected") : QString("Disconnect FAILED: %1").arg(error_name(r.error()));
        });
    }

    void setWavelength()
    {
        double nm = wavelength_spin_->value();
        run("Wavelength", [this, nm]() { return describe("Wavelength", laser_.set_wavelength(nm)); });
    }

    void setPower()
    {
        double dbm = power_spin_->value();
        run("Power", [this, dbm]() { return describe("Power", laser_.set_power(dbm)); });
    }

    void setMode()
    {
        uint16_t mode = static_cast<uint16_t>(mode_combo_->currentData().toUInt());
        run("Mode", [this, mode]() { return describe("Mode", laser_.set_mode(mode)); });
    }

    void turnOn()
    {
        run("On", [this]() { return describe("On", laser_.on()); });
    }

    void turnOff()
    {
        run("Off", [this]() { return describe("Off", laser_.off()); });
    }

private:
    // Commands run off the GUI thread; the driver orders them on the wire.
    void run(const QString& name, std::function<QString()> command)
    {
        logMsg(QString("[GUI] %1...").arg(name));
        workers_.emplace_back([this, command]() {
            QString status = command();
            std::lock_guard<std::mutex> lock(queue_mutex_);
            status_queue_.push(status);
            log_queue_.push("[GUI] " + status);
        });
    }

    static QString describe(const QString& what, const Result<Status>& r)
    {
        if (!r.ok()) {
            return QString("%1 FAILED: %2").arg(what, error_name(r.error()));
        }
        return QString("%1: %2").arg(what, status_name(r.value()));
    }

    void logMsg(const QString& msg)
    {
        QString ts = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        log_text_->append(QString("[%1] %2").arg(ts, msg));
        QScrollBar* sb = log_text_->verticalScrollBar();
        sb->setValue(sb->maximum());
    }

    std::mutex queue_mutex_;
    std::queue<QString> log_queue_;
    std::queue<QString> status_queue_;

    SerialPort serial_;
    PpclLaser laser_;
    std::vector<std::thread> workers_;
    QTimer* message_timer_;

    QLabel* status_label_;
    QLineEdit* port_edit_;
    QDoubleSpinBox* wavelength_spin_;
    QDoubleSpinBox* power_spin_;
    QComboBox* mode_combo_;
    QTextEdit* log_text_;
};

#include "laser_qt.moc"

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    LaserPanel panel;
    panel.show();
    return app.exec();
}
