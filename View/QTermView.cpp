/**
 * This file is a part of qtermdoc Project.
 * qtermdoc renders document pages inside a terminal
 * Copyright 2021-2022 Britanicus <marcusbritanicus@gmail.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * at your option, any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 **/

#include <qtermdoc/QTermView.hpp>

/* Cells moved by one pan step */
static const int PanCols = 5;
static const int PanRows = 3;

static QTermView::Action csiAction( const QByteArray& seq ) {
    static const QHash<QByteArray, QTermView::Action> keys = {
        { "\x1b[A",  QTermView::PanUp        },
        { "\x1b[B",  QTermView::PanDown      },
        { "\x1b[C",  QTermView::PanRight     },
        { "\x1b[D",  QTermView::PanLeft      },
        { "\x1bOA",  QTermView::PanUp        },
        { "\x1bOB",  QTermView::PanDown      },
        { "\x1bOC",  QTermView::PanRight     },
        { "\x1bOD",  QTermView::PanLeft      },
        { "\x1b[5~", QTermView::PageUp       },
        { "\x1b[6~", QTermView::PageDown     },
        { "\x1b[H",  QTermView::FirstPage    },
        { "\x1b[F",  QTermView::LastPage     },
        { "\x1b[1~", QTermView::FirstPage    },
        { "\x1b[4~", QTermView::LastPage     },
    };

    return keys.value( seq, QTermView::NoAction );
}


static QTermView::Action charAction( char ch ) {
    switch ( ch ) {
        case 'q':
        case 0x03: {
            return QTermView::Quit;
        }

        case '+':
        case '=': {
            return QTermView::ZoomIn;
        }

        case '-': {
            return QTermView::ZoomOut;
        }

        case '0': {
            return QTermView::ResetView;
        }

        case 'h': {
            return QTermView::PanLeft;
        }

        case 'l': {
            return QTermView::PanRight;
        }

        case 'k': {
            return QTermView::PanUp;
        }

        case 'j': {
            return QTermView::PanDown;
        }

        case ' ': {
            return QTermView::PageDown;
        }

        case 'b': {
            return QTermView::PageUp;
        }

        case 'n': {
            return QTermView::NextPage;
        }

        case 'p': {
            return QTermView::PreviousPage;
        }

        case 'g': {
            return QTermView::FirstPage;
        }

        case 'G': {
            return QTermView::LastPage;
        }

        case 'm': {
            return QTermView::ToggleMode;
        }

        case 't': {
            return QTermView::CycleTextMode;
        }

        case 'r':
        case 0x0c: {
            return QTermView::Redraw;
        }

        default: {
            return QTermView::NoAction;
        }
    }
}


QTermView::QTermView( QTermTerminal *term, QTermRenderer *renderer, QObject *parent ) : QObject( parent ) {
    mTerm     = term;
    mRenderer = renderer;

    mNotifier = nullptr;

    mResizeTimer = new QTimer( this );
    mResizeTimer->setInterval( 250 );
    connect( mResizeTimer, &QTimer::timeout, this, &QTermView::checkSize );

    mForceBlocks = false;
    mRunning     = false;

    connect( mRenderer, &QTermRenderer::frameReady, this, &QTermView::redraw );
}


QTermView::~QTermView() {
    stop();
}


void QTermView::setForceBlocks( bool yes ) {
    mForceBlocks = yes;
}


bool QTermView::start() {
    if ( mRunning ) {
        return true;
    }

    if ( not mTerm->isTty() ) {
        qCritical() << "Standard input and output must be a terminal";
        return false;
    }

    if ( not mTerm->enterRawMode() ) {
        return false;
    }

    mTerm->enterAlternateScreen();
    mTerm->setCursorVisible( false );

    /** Probe now: inside the alternate screen, before we listen for keys */
    const QTermTerminal::Hints hints = QTermTerminal::environmentHints( QProcessEnvironment::systemEnvironment() );
    const bool kitty = not mForceBlocks and mTerm->probeKitty( QTermTerminal::probeTimeout( hints ) );

    if ( kitty ) {
        mSink.reset( new QTermKittySink( mTerm->output(), 1, hints.tmux ) );
    }

    else {
        mSink.reset( new QTermBlockSink( mTerm->output() ) );
    }

    qInfo() << "Using the" << QTermSink::kindName( mSink->kind() ) << "sink";

    const QSize cell = mTerm->cellPixelSize();

    if ( cell.isValid() ) {
        mRenderer->setCellSize( cell );
    }

    mRenderer->setSink( mSink.data() );

    updateFrameGeometry();

    mNotifier = new QSocketNotifier( mTerm->inputFd(), QSocketNotifier::Read, this );
    connect(
        mNotifier, &QSocketNotifier::activated, this, [ this ] () {
            readInput();
        }
    );

    mResizeTimer->start();
    mRunning = true;

    /** Keys that arrived with the probe replies */
    QTimer::singleShot( 0, this, &QTermView::readInput );
    QTimer::singleShot( 0, this, &QTermView::redraw );

    return true;
}


void QTermView::stop() {
    if ( not mRunning ) {
        return;
    }

    mRunning = false;

    mResizeTimer->stop();

    if ( mNotifier ) {
        mNotifier->setEnabled( false );
        mNotifier->deleteLater();
        mNotifier = nullptr;
    }

    mRenderer->setSink( nullptr );

    if ( mSink ) {
        mSink->clear();
    }

    mTerm->setCursorVisible( true );
    mTerm->leaveAlternateScreen();
    mTerm->leaveRawMode();
}


QTermSink *QTermView::sink() const {
    return mSink.data();
}


QList<QTermView::Action> QTermView::parseKeys( QByteArray& buffer ) {
    QList<Action> actions;
    int           pos = 0;

    while ( pos < buffer.size() ) {
        const char ch = buffer.at( pos );

        if ( ch != '\x1b' ) {
            const Action action = charAction( ch );

            if ( action != NoAction ) {
                actions << action;
            }

            pos++;
            continue;
        }

        /** A lone escape may be the start of a sequence still on its way */
        if ( pos + 1 >= buffer.size() ) {
            break;
        }

        const char next = buffer.at( pos + 1 );

        if ( next == '[' ) {
            int end = pos + 2;

            while ( end < buffer.size() and not ( (buffer.at( end ) >= 0x40) and (buffer.at( end ) <= 0x7e) ) ) {
                end++;
            }

            if ( end >= buffer.size() ) {
                break;
            }

            const Action action = csiAction( buffer.mid( pos, end - pos + 1 ) );

            if ( action != NoAction ) {
                actions << action;
            }

            pos = end + 1;
            continue;
        }

        if ( next == 'O' ) {
            if ( pos + 2 >= buffer.size() ) {
                break;
            }

            const Action action = csiAction( buffer.mid( pos, 3 ) );

            if ( action != NoAction ) {
                actions << action;
            }

            pos += 3;
            continue;
        }

        /** Alt+key: ignore the escape */
        pos++;
    }

    buffer.remove( 0, pos );

    return actions;
}


QString QTermView::statusText( QTermRenderer *renderer, QTermSink::Kind kind ) {
    QStringList parts;

    if ( renderer->pageCount() ) {
        parts << QString( "%1/%2" ).arg( renderer->currentPage() + 1 ).arg( renderer->pageCount() );
    }

    if ( renderer->viewMode() == QTermViewerOptions::ImageView ) {
        parts << QString( "image %1%" ).arg( renderer->viewport().zoomPercent );
        parts << QTermSink::kindName( kind );

        if ( renderer->isPageFailed() ) {
            parts << "render failed";
        }
    }

    else {
        parts << "text " + QTermTextEngine::modeName( renderer->textMode() );

        if ( renderer->textLineCount() ) {
            parts << QString( "line %1/%2" ).arg( renderer->textScroll() + 1 ).arg( renderer->textLineCount() );
        }
    }

    if ( renderer->isDirty() ) {
        parts << "rendering...";
    }

    return " " + parts.join( " | " ) + " ";
}


void QTermView::handleAction( QTermView::Action action ) {
    const bool text = (mRenderer->viewMode() == QTermViewerOptions::TextView);

    switch ( action ) {
        case NoAction: {
            return;
        }

        case Quit: {
            stop();
            emit finished();

            return;
        }

        case ZoomIn: {
            mRenderer->zoomIn();
            break;
        }

        case ZoomOut: {
            mRenderer->zoomOut();
            break;
        }

        case ResetView: {
            mRenderer->resetView();
            break;
        }

        case PanLeft: {
            if ( not text ) {
                mRenderer->panBy( -PanCols, 0 );
            }

            break;
        }

        case PanRight: {
            if ( not text ) {
                mRenderer->panBy( PanCols, 0 );
            }

            break;
        }

        case PanUp: {
            if ( text ) {
                mRenderer->scrollText( -1 );
            }

            else {
                mRenderer->panBy( 0, -PanRows );
            }

            break;
        }

        case PanDown: {
            if ( text ) {
                mRenderer->scrollText( 1 );
            }

            else {
                mRenderer->panBy( 0, PanRows );
            }

            break;
        }

        case PageUp: {
            mRenderer->pageUp();
            break;
        }

        case PageDown: {
            mRenderer->pageDown();
            break;
        }

        case NextPage: {
            mRenderer->nextPage();
            break;
        }

        case PreviousPage: {
            mRenderer->previousPage();
            break;
        }

        case FirstPage: {
            mRenderer->firstPage();
            break;
        }

        case LastPage: {
            mRenderer->lastPage();
            break;
        }

        case ToggleMode: {
            mRenderer->toggleViewMode();
            break;
        }

        case CycleTextMode: {
            mRenderer->cycleTextMode();
            break;
        }

        case Redraw: {
            mTerm->clearScreen();
            mRenderer->markDirty( QTermRenderer::ForcedRedraw );
            break;
        }
    }

    redraw();
}


void QTermView::redraw() {
    if ( not mRunning ) {
        return;
    }

    mRenderer->renderFrame();
    drawStatus();
}


void QTermView::readInput() {
    if ( not mRunning ) {
        return;
    }

    mInput += mTerm->readInput();

    const QList<Action> actions = parseKeys( mInput );

    for ( Action action: actions ) {
        handleAction( action );

        if ( not mRunning ) {
            return;
        }
    }
}


void QTermView::checkSize() {
    if ( mTerm->size() == mTermSize ) {
        return;
    }

    mTerm->clearScreen();
    updateFrameGeometry();
    redraw();
}


void QTermView::updateFrameGeometry() {
    mTermSize = mTerm->size();

    /** The cell size may change with the font; only trust what the kernel tells us here */
    const QSize cell = mTerm->cellPixelSize( 0 );

    if ( cell.isValid() ) {
        mRenderer->setCellSize( cell );
    }

    mSink->setFrameOrigin( QPoint( 0, 0 ) );
    mRenderer->setFrameSize( mTermSize.width(), qMax( 1, mTermSize.height() - 1 ) );
}


void QTermView::drawStatus() {
    const int cols = mTermSize.width();
    QString   text = QTermSink::elide( statusText( mRenderer, mSink->kind() ), cols );
    const int pad  = cols - QTermTextEngine::displayWidth( text );

    if ( pad > 0 ) {
        text += QString( pad, QChar( ' ' ) );
    }

    QByteArray out = QByteArray( "\x1b[" ) + QByteArray::number( mTermSize.height() ) + ";1H\x1b[0;7m";

    out += text.toUtf8();
    out += "\x1b[0m";

    if ( mTerm->output()->write( out ) != out.size() ) {
        qWarning() << "Unable to draw the status line";
    }
}
